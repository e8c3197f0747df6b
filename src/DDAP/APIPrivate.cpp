//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <cmath>

#include "API.h"
#include "HostSideHelpers.hpp"
#include "utils/Samplers.hpp"

namespace ddap {

void EnsembleGenerator::validateFamily(const ParticleFamily& family, size_t i) const {
    switch (family.shape) {
        case SHAPE_TYPE::SPHERE:
            if (family.params.size() != 1) {
                DDAP_ERROR("Particle family %zu (%s) is a sphere family and needs exactly 1 parameter (radius), but %zu "
                           "were given.",
                           i, family.material.c_str(), family.params.size());
            }
            if (!(family.params[0] > 0.)) {
                DDAP_ERROR("Particle family %zu (%s) has a non-positive radius %f.", i, family.material.c_str(),
                           family.params[0]);
            }
            break;
        case SHAPE_TYPE::ROD:
            if (family.params.size() != 2) {
                DDAP_ERROR("Particle family %zu (%s) is a rod family and needs exactly 2 parameters (radius, height), "
                           "but %zu were given.",
                           i, family.material.c_str(), family.params.size());
            }
            if (!(family.params[0] > 0.) || !(family.params[1] > 0.)) {
                DDAP_ERROR("Particle family %zu (%s) has a non-positive radius or height.", i,
                           family.material.c_str());
            }
            if (!(family.params[1] > 2. * family.params[0])) {
                DDAP_ERROR("Particle family %zu (%s): rod height %f must be larger than twice its radius %f.", i,
                           family.material.c_str(), family.params[1], family.params[0]);
            }
            break;
    }
    if (!(family.volume_fraction > 0.) || family.volume_fraction > 1.) {
        DDAP_ERROR("Particle family %zu (%s) has volume fraction %f, which is not in (0, 1].", i,
                   family.material.c_str(), family.volume_fraction);
    }
    if (family.material_idx == 0) {
        DDAP_ERROR("Particle family %zu (%s) has material index 0; material indices start from 1.", i,
                   family.material.c_str());
    }
}

void EnsembleGenerator::validateConfiguration() const {
    if (!(m_cloudRadius > 0.)) {
        DDAP_ERROR("Cloud radius must be positive, got %f. Use SetCloudRadius to set it.", m_cloudRadius);
    }
    if (!(m_dipoleSize > 0.)) {
        DDAP_ERROR("Dipole size must be positive, got %f.", m_dipoleSize);
    }
    if (m_polydispersity < 0.) {
        DDAP_ERROR("Polydispersity cannot be negative, got %f.", m_polydispersity);
    }
    if (m_maxTrials == 0) {
        DDAP_ERROR("The maximum number of placement trials must be at least 1.");
    }
    if (m_families.empty()) {
        DDAP_ERROR("No particle family is loaded. Use LoadParticleFamily to add some.");
    }
    for (size_t i = 0; i < m_families.size(); i++) {
        validateFamily(*m_families[i], i);
    }
    if (m_option == PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE && m_families.size() != 2) {
        DDAP_ERROR("Cell-to-ensemble placement needs exactly 2 particle families, but %zu are loaded.",
                   m_families.size());
    }
}

void EnsembleGenerator::cellToEnsemble(std::vector<std::shared_ptr<const Shape>>& placed, PlacementReport& report) {
    const CellLayout layout = ComputeCellLayout();
    const double L = layout.L;
    const double R = m_cloudRadius;
    // Cell origins -R, -R + L, ... stay below R + L
    const int nCells = (int)std::ceil((2. * R + L) / L);
    DDAP_INFO("Cell-to-ensemble: %u + %u bodies per cell, cell size %g, %d cells per axis (second family fraction "
              "achieved: %g).",
              layout.N1, layout.N2, L, nCells, layout.phi2_achieved);

    const ParticleFamily& f1 = *m_families[0];
    const ParticleFamily& f2 = *m_families[1];
    const unsigned int perCell = layout.N1 + layout.N2;
    bool warnedNoFit = false;

    for (int ix = 0; ix < nCells; ix++) {
        for (int iy = 0; iy < nCells; iy++) {
            for (int iz = 0; iz < nCells; iz++) {
                const real3_t cellOrigin(-R + ix * L, -R + iy * L, -R + iz * L);
                std::vector<std::shared_ptr<const Shape>> cellBodies;
                for (unsigned int idx = 0; idx < perCell; idx++) {
                    const ParticleFamily& family = (idx < layout.N1) ? f1 : f2;
                    std::shared_ptr<Shape> body = family.MakeBody(m_rng);
                    const double r = body->GetRadius();
                    // Offsets that keep the whole body (centerline plus radius) inside the cell
                    const real3_t lo = real3_t::Constant(-L / 2. + r) - body->GetLocalCenterMin();
                    const real3_t hi = real3_t::Constant(L / 2. - r) - body->GetLocalCenterMax();
                    if (!warnedNoFit && (lo.array() > hi.array()).any()) {
                        DDAP_WARNING("A body of family %s does not fit in a cell of size %g; it is centered in the cell "
                                     "along the axes it cannot fit.",
                                     family.material.c_str(), L);
                        warnedNoFit = true;
                    }

                    unsigned int trials = 0;
                    while (true) {
                        const real3_t pos = cellOrigin + SampleUniformInBox(m_rng, lo, hi);
                        bool colliding = false;
                        for (const auto& other : cellBodies) {
                            if (CenterDistance(*body, pos, *other) < r + other->GetRadius() + CELL_CLEARANCE) {
                                colliding = true;
                                break;
                            }
                        }
                        if (!colliding) {
                            body->Move(pos);
                            cellBodies.push_back(body);
                            break;
                        }
                        trials++;
                        if (trials > m_maxTrials) {
                            placed.insert(placed.end(), cellBodies.begin(), cellBodies.end());
                            report.complete = false;
                            report.exhausted_family = family.material;
                            report.trials = trials;
                            return;
                        }
                    }
                    report.trials = trials;
                }
                placed.insert(placed.end(), cellBodies.begin(), cellBodies.end());
            }
        }
        DDAP_STATUS("CELL_TO_ENSEMBLE", "Finished cell layer %d of %d, %zu bodies placed so far", ix + 1, nCells,
                    placed.size());
    }
}

void EnsembleGenerator::volumeToEnsemble(std::vector<std::shared_ptr<const Shape>>& placed,
                                         PlacementReport& report) {
    const double R = m_cloudRadius;
    const double sampleRadius = 2. * R;
    // Bodies closer than this (center to center) may collide, so a grid of this cell size finds them all
    double maxR = 0., maxHalfAxis = 0.;
    for (const auto& family : m_families) {
        maxR = DDAP_MAX(maxR, family->GetRadius());
        maxHalfAxis = DDAP_MAX(maxHalfAxis, family->GetHalfAxisLength());
    }
    NeighborGrid grid(2. * (maxR + maxHalfAxis) + m_dipoleSize + CELL_CLEARANCE);

    for (const auto& family : m_families) {
        const double target = FOUR_OVER_THREE * PI * sampleRadius * sampleRadius * sampleRadius * family->volume_fraction;
        double familyVolume = 0.;
        size_t familyCount = 0;
        DDAP_INFO("Volume-to-ensemble: family %s targets volume %g.", family->material.c_str(), target);

        while (familyVolume < target) {
            std::shared_ptr<Shape> body = family->MakeBody(m_rng);
            const double r = body->GetRadius();
            unsigned int trials = 0;
            while (true) {
                const real3_t pos = SampleUniformInSphere(m_rng, sampleRadius);
                bool colliding = false;
                for (const size_t j : grid.GetNeighbors(pos)) {
                    const Shape& other = *placed[j];
                    if (CenterDistance(*body, pos, other) < r + other.GetRadius() + m_dipoleSize + CELL_CLEARANCE) {
                        colliding = true;
                        break;
                    }
                }
                if (!colliding) {
                    body->Move(pos);
                    grid.Insert(pos, placed.size());
                    placed.push_back(body);
                    familyVolume += body->GetVolume();
                    familyCount++;
                    break;
                }
                trials++;
                if (trials > m_maxTrials) {
                    report.complete = false;
                    report.exhausted_family = family->material;
                    report.trials = trials;
                    DDAP_STATUS("VOLUME_TO_ENSEMBLE", "Family %s stopped at %zu bodies (volume %g of %g)",
                                family->material.c_str(), familyCount, familyVolume, target);
                    return;
                }
            }
            report.trials = trials;
        }
        DDAP_STATUS("VOLUME_TO_ENSEMBLE", "Family %s reached its target with %zu bodies (volume %g of %g)",
                    family->material.c_str(), familyCount, familyVolume, target);
    }
}

std::vector<std::shared_ptr<const Shape>> EnsembleGenerator::filterByCloudRadius(
    const std::vector<std::shared_ptr<const Shape>>& placed) const {
    std::vector<std::shared_ptr<const Shape>> kept;
    for (const auto& body : placed) {
        if (body->GetCenterPoint().norm() < m_cloudRadius)
            kept.push_back(body);
    }
    return kept;
}

}  // namespace ddap
