//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <cmath>

#include "API.h"
#include "HostSideHelpers.hpp"

namespace ddap {

// =============================================================================
// ParticleFamily
// =============================================================================

double ParticleFamily::GetUnitVolume() const {
    // A fixed orientation keeps this query from consuming any randomness
    randomEngine_t unused;
    return CreateShape(shape, params, eulerAngles_t{0., 0., 0.}, unused)->GetVolume();
}

double ParticleFamily::GetHalfAxisLength() const {
    if (shape == SHAPE_TYPE::SPHERE)
        return 0.;
    return params.at(1) / 2. - params.at(0);
}

std::shared_ptr<Shape> ParticleFamily::MakeBody(randomEngine_t& re) const {
    std::shared_ptr<Shape> body = CreateShape(shape, params, rotation, re);
    body->SetMaterial(material);
    body->SetMaterialIndex(material_idx);
    return body;
}

// =============================================================================
// EnsembleGenerator
// =============================================================================

EnsembleGenerator::EnsembleGenerator() {
    m_rng.seed(randomEngine_t::default_seed);
}

void EnsembleGenerator::SetVerbosity(verbosity_t verbose) {
    Logger::GetInstance().SetVerbosity(verbose);
}

void EnsembleGenerator::SetVerbosity(const std::string& verbose) {
    std::string u_verbose = str_to_upper(verbose);
    switch (hash_charr(u_verbose.c_str())) {
        case ("QUIET"_):
            SetVerbosity(VERBOSITY_QUIET);
            break;
        case ("ERROR"_):
            SetVerbosity(VERBOSITY_ERROR);
            break;
        case ("WARNING"_):
            SetVerbosity(VERBOSITY_WARNING);
            break;
        case ("INFO"_):
            SetVerbosity(VERBOSITY_INFO);
            break;
        case ("STEP"_):
            SetVerbosity(VERBOSITY_STEP);
            break;
        case ("DEBUG"_):
            SetVerbosity(VERBOSITY_DEBUG);
            break;
        default:
            DDAP_ERROR("Instruction %s is unknown in SetVerbosity call.", verbose.c_str());
    }
}

void EnsembleGenerator::SetPlacementStrategy(const std::string& option) {
    std::string u_option = str_to_upper(option);
    switch (hash_charr(u_option.c_str())) {
        case ("C2E"_):
        case ("CELL-TO-ENSEMBLE"_):
        case ("CELL_TO_ENSEMBLE"_):
            m_option = PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE;
            break;
        case ("V2E"_):
        case ("VOLUME-TO-ENSEMBLE"_):
        case ("VOLUME_TO_ENSEMBLE"_):
            m_option = PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE;
            break;
        default:
            DDAP_ERROR("Placement strategy %s is unknown. Please select from cell-to-ensemble (c2e) and "
                       "volume-to-ensemble (v2e).",
                       option.c_str());
    }
}

void EnsembleGenerator::SetRandomSeed(unsigned int seed) {
    m_rng.seed(seed);
}

std::shared_ptr<ParticleFamily> EnsembleGenerator::LoadParticleFamily(const std::string& shape,
                                                                      const std::vector<double>& params,
                                                                      double volume_fraction,
                                                                      const std::string& material,
                                                                      materialIdx_t material_idx) {
    ParticleFamily family;
    family.shape = ParseShapeType(shape);
    family.params = params;
    family.volume_fraction = volume_fraction;
    family.material = material;
    family.material_idx = material_idx;
    std::shared_ptr<ParticleFamily> ptr = std::make_shared<ParticleFamily>(std::move(family));
    m_families.push_back(ptr);
    return m_families.back();
}

std::shared_ptr<ParticleFamily> EnsembleGenerator::LoadParticleFamily(const std::string& shape,
                                                                      const std::vector<double>& params,
                                                                      double volume_fraction,
                                                                      const std::string& material,
                                                                      materialIdx_t material_idx,
                                                                      const eulerAngles_t& rotation) {
    std::shared_ptr<ParticleFamily> ptr = LoadParticleFamily(shape, params, volume_fraction, material, material_idx);
    if (ptr->shape == SHAPE_TYPE::SPHERE) {
        DDAP_WARNING("Family %s is made of spheres; its rotation instruction is ignored.", material.c_str());
    } else {
        ptr->rotation = rotation;
    }
    return ptr;
}

CellLayout EnsembleGenerator::ComputeCellLayout() const {
    validateConfiguration();
    if (m_families.size() != 2) {
        DDAP_ERROR("Cell-to-ensemble placement needs exactly 2 particle families, but %zu are loaded.",
                   m_families.size());
    }
    const ParticleFamily& f1 = *m_families[0];
    const ParticleFamily& f2 = *m_families[1];
    const double V1 = f1.GetUnitVolume();
    const double V2 = f2.GetUnitVolume();
    const double phi1 = f1.volume_fraction;
    const double phi2 = f2.volume_fraction;

    const double ratio = (phi1 * V2) / (phi2 * V1);
    const auto frac = BestRationalApproximation(ratio, MAX_CELL_RATIO_DENOMINATOR);
    if (frac.first <= 0) {
        DDAP_ERROR(
            "The particle-count ratio %f of families %s and %s rounds to zero particles of the first family per cell. "
            "Please increase the first family's volume fraction.",
            ratio, f1.material.c_str(), f2.material.c_str());
    }

    if (frac.first + frac.second > (long long)MAX_BODIES_PER_CELL) {
        DDAP_ERROR(
            "The particle-count ratio %f of families %s and %s needs %lld + %lld bodies per cell, more than the %u "
            "allowed. Please bring the two families' volume fractions and sizes closer together.",
            ratio, f1.material.c_str(), f2.material.c_str(), frac.first, frac.second, MAX_BODIES_PER_CELL);
    }

    CellLayout layout;
    layout.N1 = (unsigned int)frac.first;
    layout.N2 = (unsigned int)frac.second;
    const double Vcell = (double)layout.N1 * V1 / phi1;
    layout.L = std::ceil(std::cbrt(Vcell));
    layout.phi2_achieved = (double)layout.N2 * V2 / Vcell;
    return layout;
}

Ensemble EnsembleGenerator::Generate() {
    validateConfiguration();

    DDAP_INFO("Generating an ensemble of radius %g (dipole size %g) with the %s strategy and %zu particle famil%s.",
              m_cloudRadius, m_dipoleSize, PlacementStrategyName(m_option).c_str(), m_families.size(),
              (m_families.size() == 1) ? "y" : "ies");

    std::vector<std::shared_ptr<const Shape>> placed;
    PlacementReport report;

    m_timer.reset();
    m_timer.start();
    switch (m_option) {
        case PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE:
            cellToEnsemble(placed, report);
            break;
        case PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE:
            volumeToEnsemble(placed, report);
            break;
    }

    Ensemble ensemble(m_cloudRadius, m_dipoleSize, m_polydispersity, m_option);
    ensemble.m_bodies = filterByCloudRadius(placed);
    m_timer.stop();

    report.num_placed = placed.size();
    report.num_kept = ensemble.m_bodies.size();
    report.elapsed_seconds = m_timer.GetTimeSeconds();
    ensemble.m_report = report;

    if (!report.complete) {
        DDAP_WARNING(
            "Placement stopped early: a body of family %s was rejected more than %u times in a row. The returned "
            "ensemble is partial (%zu bodies).",
            report.exhausted_family.c_str(), m_maxTrials, report.num_kept);
    }
    for (const auto& family : m_families) {
        size_t n = 0;
        for (const auto& body : ensemble.m_bodies) {
            if (body->GetMaterialIndex() == family->material_idx && body->GetMaterial() == family->material)
                n++;
        }
        DDAP_INFO("Family %s (%s): %zu bodies kept.", family->material.c_str(), ShapeTypeName(family->shape).c_str(),
                  n);
    }
    DDAP_INFO("%zu of %zu placed bodies kept inside the cloud; placement took %.3f seconds.", report.num_kept,
              report.num_placed, report.elapsed_seconds);
    return ensemble;
}

}  // namespace ddap
