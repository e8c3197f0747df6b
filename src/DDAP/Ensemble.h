//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_ENSEMBLE_H
#define DDAP_ENSEMBLE_H

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Defines.h"
#include "Geometry.h"
#include "Shapes.h"

namespace ddap {

/// Outcome of a placement pass.
struct PlacementReport {
    /// False if some body ran out of its retry budget and placement stopped early
    bool complete = true;
    /// Material label of the family whose body could not be placed (empty when complete)
    std::string exhausted_family;
    /// Rejected trials spent on the last body attempted
    unsigned int trials = 0;
    /// Bodies accepted before the cloud-radius filter
    size_t num_placed = 0;
    /// Bodies that survived the cloud-radius filter
    size_t num_kept = 0;
    double elapsed_seconds = 0.;
};

/// Flat description of one body in physical units, as exchanged with persistence.
struct ParticleRecord {
    std::string shape;
    double radius = 0.;
    std::optional<double> length;
    double volume = 0.;
    std::array<double, 3> center = {0., 0., 0.};
    std::optional<eulerAngles_t> rotation;
    std::string material;
    materialIdx_t material_idx = 1;
};

/// Dipole coordinates occupied by one body, tagged with its material index.
struct TaggedLattice {
    size_t body;
    materialIdx_t material_idx;
    std::vector<lattice3_t> dipoles;
};

/// @brief A populated particle cloud.
/// @details Built by EnsembleGenerator (or rehydrated from records) and not mutated afterwards; discretization,
/// distributions and summaries are derived read-only views. All lengths are in dipole units unless a method says
/// otherwise.
class Ensemble {
  public:
    Ensemble(double cloud_radius,
             double dipole_size,
             double polydispersity = 0.,
             PLACEMENT_STRATEGY option = PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE);
    ~Ensemble() {}

    double GetCloudRadius() const { return m_cloudRadius; }
    double GetDipoleSize() const { return m_dipoleSize; }
    double GetPolydispersity() const { return m_polydispersity; }
    PLACEMENT_STRATEGY GetPlacementStrategy() const { return m_option; }
    const PlacementReport& GetPlacementReport() const { return m_report; }

    const std::vector<std::shared_ptr<const Shape>>& GetBodies() const { return m_bodies; }
    /// Independent copies of the bodies; changing them leaves the ensemble untouched.
    std::vector<std::shared_ptr<Shape>> CopyBodies() const;
    size_t GetNumBodies() const { return m_bodies.size(); }
    size_t GetNumSpheres() const;
    size_t GetNumRods() const;

    /// @brief Per-body dipole sets, in body order.
    /// @details Bodies are handed out to nThreads workers; each worker only writes its own bodies' slots.
    std::vector<TaggedLattice> Discretize(unsigned int nThreads, const LatticeSampler& sampler) const;
    std::vector<TaggedLattice> Discretize(unsigned int nThreads = 1) const;
    /// Union of all bodies' dipoles, deduplicated and sorted.
    std::vector<lattice3_t> DiscretizeCloud(unsigned int nThreads, const LatticeSampler& sampler) const;
    std::vector<lattice3_t> DiscretizeCloud(unsigned int nThreads = 1) const;

    /// Pairwise angle/distance histograms, keyed by category name.
    std::map<std::string, HistogramDistribution> EvaluateDistribution() const;
    /// Pairwise center distances, 20 bins over [0, 2 * cloud radius).
    HistogramDistribution EvaluateCenterDistribution() const;

    /// Sum of body volumes (dipole units cubed).
    double GetTotalVolume() const;
    /// Radius of a sphere with the total body volume, in dipole units.
    double GetEffectiveRadius() const;
    /// Same as GetEffectiveRadius, in physical length.
    double GetEffectiveRadiusPhysical() const { return GetEffectiveRadius() * m_dipoleSize; }
    /// Total body volume over the cloud ball volume.
    double GetVolumeFraction() const;

    /// A copy holding only the spheres, in their original order.
    Ensemble GetSphereSubset() const;

    /// Bodies in physical units: lengths times dipole size, volumes times its cube.
    std::vector<ParticleRecord> ExportRecords() const;

    /// @brief Rebuild an ensemble from physical-unit records.
    /// @details Lengths are divided by the dipole size. Rods must carry their rotation. Invalid rows throw
    /// DDAPException.
    static Ensemble FromRecords(const std::vector<ParticleRecord>& rows,
                                double cloud_radius_phys,
                                double dipole_size,
                                PLACEMENT_STRATEGY option = PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE,
                                double polydispersity = 0.);

  private:
    friend class EnsembleGenerator;

    double m_cloudRadius;
    double m_dipoleSize;
    double m_polydispersity;
    PLACEMENT_STRATEGY m_option;
    PlacementReport m_report;

    std::vector<std::shared_ptr<const Shape>> m_bodies;
};

}  // namespace ddap

#endif
