//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <cmath>
#include <thread>

#include "Ensemble.h"
#include "HostSideHelpers.hpp"
#include "../core/utils/Logger.hpp"
#include "../core/utils/Timer.hpp"

namespace ddap {

Ensemble::Ensemble(double cloud_radius, double dipole_size, double polydispersity, PLACEMENT_STRATEGY option)
    : m_cloudRadius(cloud_radius), m_dipoleSize(dipole_size), m_polydispersity(polydispersity), m_option(option) {
    if (!(cloud_radius > 0.)) {
        DDAP_ERROR("Cloud radius must be positive, got %f.", cloud_radius);
    }
    if (!(dipole_size > 0.)) {
        DDAP_ERROR("Dipole size must be positive, got %f.", dipole_size);
    }
}

std::vector<std::shared_ptr<Shape>> Ensemble::CopyBodies() const {
    std::vector<std::shared_ptr<Shape>> res;
    res.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        res.push_back(body->Clone());
    }
    return res;
}

size_t Ensemble::GetNumSpheres() const {
    size_t n = 0;
    for (const auto& body : m_bodies) {
        if (body->GetType() == SHAPE_TYPE::SPHERE)
            n++;
    }
    return n;
}

size_t Ensemble::GetNumRods() const {
    return m_bodies.size() - GetNumSpheres();
}

std::vector<TaggedLattice> Ensemble::Discretize(unsigned int nThreads, const LatticeSampler& sampler) const {
    Timer<double> timer;
    timer.start();
    std::vector<TaggedLattice> res(m_bodies.size());
    const unsigned int nWorkers = DDAP_MAX(1u, DDAP_MIN(nThreads, (unsigned int)m_bodies.size()));

    auto work = [&](unsigned int worker) {
        for (size_t i = worker; i < m_bodies.size(); i += nWorkers) {
            res[i].body = i;
            res[i].material_idx = m_bodies[i]->GetMaterialIndex();
            res[i].dipoles = m_bodies[i]->Discretize(sampler);
        }
    };

    if (nWorkers == 1) {
        work(0);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(nWorkers);
        for (unsigned int w = 0; w < nWorkers; w++) {
            workers.emplace_back(work, w);
        }
        for (auto& t : workers) {
            t.join();
        }
    }
    timer.stop();
    DDAP_STATUS("DISCRETIZATION", "Discretized %zu bodies with %u worker(s) in %llu ms", m_bodies.size(), nWorkers,
                timer.GetTimeMilliseconds());
    return res;
}

std::vector<TaggedLattice> Ensemble::Discretize(unsigned int nThreads) const {
    return Discretize(nThreads, BoxScanSampler());
}

std::vector<lattice3_t> Ensemble::DiscretizeCloud(unsigned int nThreads, const LatticeSampler& sampler) const {
    const std::vector<TaggedLattice> perBody = Discretize(nThreads, sampler);
    std::vector<lattice3_t> all;
    for (const auto& body : perBody) {
        all.insert(all.end(), body.dipoles.begin(), body.dipoles.end());
    }
    return hostUniqueLattice(all);
}

std::vector<lattice3_t> Ensemble::DiscretizeCloud(unsigned int nThreads) const {
    return DiscretizeCloud(nThreads, BoxScanSampler());
}

std::map<std::string, HistogramDistribution> Ensemble::EvaluateDistribution() const {
    return ::ddap::EvaluateDistribution(m_bodies);
}

HistogramDistribution Ensemble::EvaluateCenterDistribution() const {
    return ::ddap::EvaluateCenterDistribution(m_bodies, m_cloudRadius);
}

double Ensemble::GetTotalVolume() const {
    double vol = 0.;
    for (const auto& body : m_bodies) {
        vol += body->GetVolume();
    }
    return vol;
}

double Ensemble::GetEffectiveRadius() const {
    return std::cbrt(3. * GetTotalVolume() / (4. * PI));
}

double Ensemble::GetVolumeFraction() const {
    return GetTotalVolume() / (FOUR_OVER_THREE * PI * m_cloudRadius * m_cloudRadius * m_cloudRadius);
}

Ensemble Ensemble::GetSphereSubset() const {
    Ensemble subset(m_cloudRadius, m_dipoleSize, m_polydispersity, m_option);
    for (const auto& body : m_bodies) {
        if (body->GetType() == SHAPE_TYPE::SPHERE)
            subset.m_bodies.push_back(body);
    }
    subset.m_report = m_report;
    subset.m_report.num_kept = subset.m_bodies.size();
    return subset;
}

std::vector<ParticleRecord> Ensemble::ExportRecords() const {
    const double ds = m_dipoleSize;
    std::vector<ParticleRecord> rows;
    rows.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        ParticleRecord row;
        row.shape = body->GetTypeName();
        row.radius = body->GetRadius() * ds;
        if (body->GetLength().has_value())
            row.length = *body->GetLength() * ds;
        row.volume = body->GetVolume() * ds * ds * ds;
        const real3_t c = body->GetCenterPoint() * ds;
        row.center = {c.x(), c.y(), c.z()};
        row.rotation = body->GetRotation();
        row.material = body->GetMaterial();
        row.material_idx = body->GetMaterialIndex();
        rows.push_back(row);
    }
    return rows;
}

Ensemble Ensemble::FromRecords(const std::vector<ParticleRecord>& rows,
                               double cloud_radius_phys,
                               double dipole_size,
                               PLACEMENT_STRATEGY option,
                               double polydispersity) {
    if (!(dipole_size > 0.)) {
        DDAP_ERROR("Dipole size must be positive, got %f.", dipole_size);
    }
    Ensemble ensemble(cloud_radius_phys / dipole_size, dipole_size, polydispersity, option);
    // Rehydration never draws an orientation, so this engine is never consumed
    randomEngine_t unused;
    for (size_t i = 0; i < rows.size(); i++) {
        const ParticleRecord& row = rows[i];
        const SHAPE_TYPE type = ParseShapeType(row.shape);
        std::vector<double> params = {row.radius / dipole_size};
        if (type == SHAPE_TYPE::ROD) {
            if (!row.length.has_value()) {
                DDAP_ERROR("Record %zu is a rod but carries no length.", i);
            }
            if (!row.rotation.has_value()) {
                DDAP_ERROR("Record %zu is a rod but carries no rotation.", i);
            }
            params.push_back(*row.length / dipole_size);
        }
        if (row.material_idx == 0) {
            DDAP_ERROR("Record %zu has material index 0; indices start from 1.", i);
        }
        std::shared_ptr<Shape> body = CreateShape(type, params, row.rotation, unused);
        body->Move(real3_t(row.center[0], row.center[1], row.center[2]) / dipole_size);
        body->SetMaterial(row.material);
        body->SetMaterialIndex(row.material_idx);
        ensemble.m_bodies.push_back(body);
    }
    ensemble.m_report.num_placed = ensemble.m_bodies.size();
    ensemble.m_report.num_kept = ensemble.m_bodies.size();
    return ensemble;
}

}  // namespace ddap
