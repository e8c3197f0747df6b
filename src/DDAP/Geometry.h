//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_GEOMETRY_H
#define DDAP_GEOMETRY_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Defines.h"

namespace ddap {

class Shape;

/// A finite line segment (a rod's cylindrical axis).
struct Segment {
    real3_t p1;
    real3_t p2;

    Segment() : p1(real3_t::Zero()), p2(real3_t::Zero()) {}
    Segment(const real3_t& a, const real3_t& b) : p1(a), p2(b) {}

    real3_t Midpoint() const { return 0.5 * (p1 + p2); }
    double Length() const { return (p2 - p1).norm(); }
};

// -----------------------------------------------------------------------------
// Distances between center geometries: a point (sphere) or a segment (rod)
// -----------------------------------------------------------------------------

double Distance(const real3_t& a, const real3_t& b);
/// Distance from a point to the closest location on a segment. A zero-length segment acts as a point.
double Distance(const real3_t& p, const Segment& s);
double Distance(const Segment& s, const real3_t& p);
/// Distance between the closest pair of points, one on each segment. Parallel, degenerate and coincident inputs are
/// handled explicitly; the result is always finite and non-negative.
double Distance(const Segment& s1, const Segment& s2);

/// @brief Angle (degrees, in [0, 180]) between a segment and the direction from its nearer endpoint to a point.
/// @details The endpoint farther from the point is the far anchor and the other one the near anchor; the angle is
/// measured between the far-to-near direction and the near-anchor-to-point direction. A point equidistant from both
/// endpoints gives 90. A zero-length segment, or a point sitting on the near anchor, gives 0.
double AngleToSegment(const real3_t& point, const Segment& s);

// -----------------------------------------------------------------------------
// Histograms
// -----------------------------------------------------------------------------

/// Binned counts. bin_edges has one more entry than counts and increases monotonically.
struct HistogramDistribution {
    std::vector<unsigned long long> counts;
    std::vector<double> bin_edges;

    unsigned long long GetTotalCount() const;
};

/// @brief Bin values into num_bins equal-width bins spanning [lo, hi].
/// @details Values outside the range are dropped. Bins are half-open except the last one, which is closed on the
/// right, unless closeLastBin is false.
HistogramDistribution MakeHistogram(const std::vector<double>& values,
                                    double lo,
                                    double hi,
                                    unsigned int num_bins,
                                    bool closeLastBin = true);

// -----------------------------------------------------------------------------
// Shape-aware queries
// -----------------------------------------------------------------------------

/// Distance between the center geometries of two bodies.
double CenterDistance(const Shape& a, const Shape& b);
/// Same as above, but with body a moved by offset first (used to test a candidate placement without moving it).
double CenterDistance(const Shape& a, const real3_t& offset, const Shape& b);

/// @brief Pairwise angle and distance histograms over a set of bodies.
/// @details Returns category name -> histogram. Angles use 36 bins over [0, 180]; distances 78 bins over [2r, 80r],
/// r being the mean sphere radius (mean rod radius when there are no spheres). Categories without enough bodies to
/// form a pair are omitted.
std::map<std::string, HistogramDistribution> EvaluateDistribution(
    const std::vector<std::shared_ptr<const Shape>>& bodies);

/// Pairwise center-geometry distances of all bodies, 20 equal half-open bins over [0, 2 * cloud_radius).
HistogramDistribution EvaluateCenterDistribution(const std::vector<std::shared_ptr<const Shape>>& bodies,
                                                 double cloud_radius);

}  // namespace ddap

#endif
