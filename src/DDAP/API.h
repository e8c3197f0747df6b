//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_API
#define DDAP_API

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/utils/Logger.hpp"
#include "../core/utils/Timer.hpp"
#include "Defines.h"
#include "Geometry.h"
#include "Shapes.h"
#include "Ensemble.h"

/// Main namespace for the DDAPack package.
namespace ddap {

/// A family of identical-material bodies the generator places, in the order families are loaded.
struct ParticleFamily {
    SHAPE_TYPE shape;
    /// [radius] for spheres, [radius, height] for rods, in dipole units
    std::vector<double> params;
    /// Target volume fraction, in (0, 1]
    double volume_fraction;
    std::string material;
    materialIdx_t material_idx;
    /// Fixed rod orientation; empty means each rod draws its own uniformly
    std::optional<eulerAngles_t> rotation;

    /// Volume of one body of this family.
    double GetUnitVolume() const;
    double GetRadius() const { return params.at(0); }
    /// Half of the cylindrical axis length (0 for spheres).
    double GetHalfAxisLength() const;

    /// Construct a fresh, unplaced body of this family (material tags set).
    std::shared_ptr<Shape> MakeBody(randomEngine_t& re) const;
};

/// Per-cell particle counts and cell edge length used by the cell-to-ensemble strategy.
struct CellLayout {
    unsigned int N1;
    unsigned int N2;
    /// Cell edge length, dipole units
    double L;
    /// Second-family volume fraction that the integer counts actually realize
    double phi2_achieved;
};

/// Main DDAPack ensemble builder.
class EnsembleGenerator {
  public:
    EnsembleGenerator();
    ~EnsembleGenerator() {}

    /// Set output detail level (applies to the package-wide logger).
    void SetVerbosity(verbosity_t verbose);
    /// Set output detail level. Choose between QUIET, ERROR, WARNING, INFO, STEP and DEBUG.
    void SetVerbosity(const std::string& verbose);

    /// Set the radius of the cloud, in dipole units. Only bodies centered strictly inside it are kept.
    void SetCloudRadius(double radius) { m_cloudRadius = radius; }
    /// Set the physical length of one lattice unit.
    void SetDipoleSize(double size) { m_dipoleSize = size; }
    /// Set the polydispersity tag carried by generated ensembles (informational).
    void SetPolydispersity(double p) { m_polydispersity = p; }

    /// Select the placement strategy.
    void SetPlacementStrategy(PLACEMENT_STRATEGY option) { m_option = option; }
    /// Select the placement strategy by name: cell-to-ensemble (c2e) or volume-to-ensemble (v2e).
    void SetPlacementStrategy(const std::string& option);

    /// Re-seed the random engine. The same seed and configuration reproduce the same ensemble.
    void SetRandomSeed(unsigned int seed);
    /// Set how many consecutive rejected trials a single body may accumulate before placement stops.
    void SetMaxPlacementTrials(unsigned int n) { m_maxTrials = n; }

    double GetCloudRadius() const { return m_cloudRadius; }
    double GetDipoleSize() const { return m_dipoleSize; }
    double GetPolydispersity() const { return m_polydispersity; }
    PLACEMENT_STRATEGY GetPlacementStrategy() const { return m_option; }
    unsigned int GetMaxPlacementTrials() const { return m_maxTrials; }
    randomEngine_t& GetRandomEngine() { return m_rng; }

    /// @brief Load a family of bodies to place.
    /// @param shape "sphere" or "rod".
    /// @param params [radius] or [radius, height], dipole units.
    /// @param volume_fraction Target volume fraction, in (0, 1].
    /// @param material Material label passed through to the bodies.
    /// @param material_idx Material index handed to the solver, starting from 1.
    /// @return The family, which can still be altered before Generate is called.
    std::shared_ptr<ParticleFamily> LoadParticleFamily(const std::string& shape,
                                                       const std::vector<double>& params,
                                                       double volume_fraction,
                                                       const std::string& material,
                                                       materialIdx_t material_idx);
    /// Same as above, with every rod of the family sharing an explicit orientation (degrees about x, y, z).
    std::shared_ptr<ParticleFamily> LoadParticleFamily(const std::string& shape,
                                                       const std::vector<double>& params,
                                                       double volume_fraction,
                                                       const std::string& material,
                                                       materialIdx_t material_idx,
                                                       const eulerAngles_t& rotation);

    const std::vector<std::shared_ptr<ParticleFamily>>& GetParticleFamilies() const { return m_families; }
    void ClearParticleFamilies() { m_families.clear(); }

    /// @brief Particle counts and cell size of the cell-to-ensemble strategy.
    /// @details The volume-fraction ratio of the two loaded families is approximated by N1/N2 with N2 at most 20; the
    /// cell is sized so the first family meets its fraction exactly.
    CellLayout ComputeCellLayout() const;

    /// @brief Build an ensemble with the selected strategy.
    /// @details The configuration is validated in full first; invalid configuration throws DDAPException. Running out
    /// of placement trials does not throw: the partial ensemble is returned and its placement report says so.
    Ensemble Generate();

  private:
    // Throws on the first invalid configuration entry found
    void validateConfiguration() const;
    void validateFamily(const ParticleFamily& family, size_t i) const;

    // Placement strategies; they fill placed with every accepted body, in acceptance order
    void cellToEnsemble(std::vector<std::shared_ptr<const Shape>>& placed, PlacementReport& report);
    void volumeToEnsemble(std::vector<std::shared_ptr<const Shape>>& placed, PlacementReport& report);

    // Keep bodies centered strictly within the cloud radius
    std::vector<std::shared_ptr<const Shape>> filterByCloudRadius(
        const std::vector<std::shared_ptr<const Shape>>& placed) const;

    double m_cloudRadius = 0.;
    double m_dipoleSize = 1.;
    double m_polydispersity = 0.;
    PLACEMENT_STRATEGY m_option = PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE;
    unsigned int m_maxTrials = DEFAULT_MAX_PLACEMENT_TRIALS;

    randomEngine_t m_rng;

    std::vector<std::shared_ptr<ParticleFamily>> m_families;

    Timer<double> m_timer;
};

}  // namespace ddap

#endif
