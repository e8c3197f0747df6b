//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_SAMPLERS_HPP
#define DDAP_SAMPLERS_HPP

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../HostSideHelpers.hpp"

namespace ddap {

// -----------------------------------------------------------------------------
// Random draws used by the placement strategies
//
// Every draw goes through the engine the caller hands in, so a seeded generator reproduces its ensemble exactly.
// -----------------------------------------------------------------------------

/// Uniform point in the axis-aligned box [lo, hi]. An axis with lo > hi (the body does not fit) collapses to the
/// midpoint of the two bounds.
inline real3_t SampleUniformInBox(randomEngine_t& re, const real3_t& lo, const real3_t& hi) {
    real3_t p;
    for (int i = 0; i < 3; i++) {
        if (lo[i] > hi[i]) {
            p[i] = 0.5 * (lo[i] + hi[i]);
        } else {
            std::uniform_real_distribution<double> dist(lo[i], hi[i]);
            p[i] = dist(re);
        }
    }
    return p;
}

/// Uniform-by-volume point in a ball of the given radius centered at the origin.
inline real3_t SampleUniformInSphere(randomEngine_t& re, double radius) {
    std::uniform_real_distribution<double> realDist(0.0, 1.0);
    const double phi = 2. * PI * realDist(re);
    const double cos_theta = 2. * realDist(re) - 1.;
    const double u = realDist(re);
    const double sin_theta = std::sqrt(DDAP_MAX(0., 1. - cos_theta * cos_theta));
    const double r = radius * std::cbrt(u);
    return real3_t(r * sin_theta * std::cos(phi), r * sin_theta * std::sin(phi), r * cos_theta);
}

/// Three independent rotation angles, uniform in [0, 360) degrees.
inline eulerAngles_t SampleEulerAngles(randomEngine_t& re) {
    std::uniform_real_distribution<double> angleDist(0.0, 360.0);
    eulerAngles_t angles;
    for (int i = 0; i < 3; i++) {
        angles[i] = wrapDegrees(angleDist(re));
    }
    return angles;
}

// -----------------------------------------------------------------------------
// Lattice samplers
// -----------------------------------------------------------------------------

/// A solid that can be scanned onto the integer lattice, described in its own local frame.
class LatticeSolid {
  public:
    virtual ~LatticeSolid() {}

    /// Whether a local-frame point belongs to the solid (boundary included).
    virtual bool PointInside(const real3_t& p) const = 0;

    /// Half-extents (integer) of the local bounding box that must be scanned.
    virtual lattice3_t LocalLatticeExtent() const = 0;

    /// Squared radius of the solid's circular cross-section at local height z; negative if the plane misses it.
    virtual double SliceRadiusSquared(double z) const = 0;
};

/// Lattice discretization method.
enum class LATTICE_SAMPLER { BOX_SCAN, SLICE_SCAN };

/// Base class for the strategies that enumerate the integer lattice points inside a solid.
class LatticeSampler {
  public:
    virtual ~LatticeSampler() {}

    /// Return every integer lattice point (local frame) that lies inside the solid.
    virtual std::vector<lattice3_t> Sample(const LatticeSolid& solid) const = 0;

    virtual LATTICE_SAMPLER GetType() const = 0;
};

/// Exhaustive scan of the local bounding box.
class BoxScanSampler : public LatticeSampler {
  public:
    BoxScanSampler() {}

    virtual std::vector<lattice3_t> Sample(const LatticeSolid& solid) const override;
    virtual LATTICE_SAMPLER GetType() const override { return LATTICE_SAMPLER::BOX_SCAN; }
};

/// Scan by z-slices: each lattice row's interior span is computed in closed form from the slice radius, then
/// corrected against the exact containment test so the result equals the box scan.
class SliceScanSampler : public LatticeSampler {
  public:
    SliceScanSampler() {}

    virtual std::vector<lattice3_t> Sample(const LatticeSolid& solid) const override;
    virtual LATTICE_SAMPLER GetType() const override { return LATTICE_SAMPLER::SLICE_SCAN; }
};

// -----------------------------------------------------------------------------
// Neighbor grid
// -----------------------------------------------------------------------------

/// Sparse uniform grid over body positions. A body whose position is farther than one cell size (along any axis)
/// from a query point is never returned, so the cell size must bound the largest possible interaction range.
class NeighborGrid {
  public:
    NeighborGrid(double cellSize);

    void Insert(const real3_t& p, size_t idx);

    /// Indices stored in the 3x3x3 block of cells around the point, in ascending order.
    std::vector<size_t> GetNeighbors(const real3_t& p) const;

    void Clear() { m_cells.clear(); }

    size_t GetNumCells() const { return m_cells.size(); }
    double GetCellSize() const { return m_cellSize; }

  private:
    int64_t key(int i, int j, int k) const;
    lattice3_t cellOf(const real3_t& p) const;

    double m_cellSize;
    std::unordered_map<int64_t, std::vector<size_t>> m_cells;
};

}  // namespace ddap

#endif
