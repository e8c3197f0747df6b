//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <cmath>

#include "Geometry.h"
#include "Shapes.h"
#include "HostSideHelpers.hpp"
#include "../core/utils/Logger.hpp"

namespace ddap {

double Distance(const real3_t& a, const real3_t& b) {
    return (a - b).norm();
}

double Distance(const real3_t& p, const Segment& s) {
    const real3_t d = s.p2 - s.p1;
    const double dd = d.dot(d);
    if (dd <= 0.) {
        return Distance(p, s.p1);
    }
    const double t = clampValue((p - s.p1).dot(d) / dd, 0., 1.);
    const real3_t closest = s.p1 + t * d;
    return (p - closest).norm();
}

double Distance(const Segment& s, const real3_t& p) {
    return Distance(p, s);
}

double Distance(const Segment& s1, const Segment& s2) {
    const real3_t u = s1.p2 - s1.p1;
    const real3_t v = s2.p2 - s2.p1;
    const real3_t w0 = s1.p1 - s2.p1;

    const double a = u.dot(u);
    const double b = u.dot(v);
    const double c = v.dot(v);
    const double d = u.dot(w0);
    const double e = v.dot(w0);

    // Both degenerate to points
    if (a <= DDAP_TINY_FLOAT && c <= DDAP_TINY_FLOAT) {
        return Distance(s1.p1, s2.p1);
    }

    const double denom = a * c - b * b;
    // (Near-)parallel, or one of them is a point: the closest pair then involves at least one endpoint
    if (a <= DDAP_TINY_FLOAT || c <= DDAP_TINY_FLOAT || denom <= DDAP_TINY_FLOAT * a * c) {
        double dist = Distance(s1.p1, s2);
        dist = DDAP_MIN(dist, Distance(s1.p2, s2));
        dist = DDAP_MIN(dist, Distance(s2.p1, s1));
        dist = DDAP_MIN(dist, Distance(s2.p2, s1));
        return dist;
    }

    double sc = clampValue((b * e - c * d) / denom, 0., 1.);
    // Best tc for the clamped sc, then re-fit sc to the clamped tc
    double tc = clampValue((e + b * sc) / c, 0., 1.);
    sc = clampValue((b * tc - d) / a, 0., 1.);

    const real3_t pointOnS1 = s1.p1 + sc * u;
    const real3_t pointOnS2 = s2.p1 + tc * v;
    return (pointOnS1 - pointOnS2).norm();
}

double AngleToSegment(const real3_t& point, const Segment& s) {
    if (s.Length() <= DDAP_TINY_FLOAT) {
        return 0.;
    }
    const double d1 = Distance(point, s.p1);
    const double d2 = Distance(point, s.p2);
    const double scale = DDAP_MAX(1., DDAP_MAX(d1, d2));
    if (std::abs(d1 - d2) <= DDAP_TINY_FLOAT * scale) {
        return 90.;
    }
    const real3_t& farEnd = (d1 > d2) ? s.p1 : s.p2;
    const real3_t& nearEnd = (d1 > d2) ? s.p2 : s.p1;

    const real3_t axis = nearEnd - farEnd;
    const real3_t toPoint = point - nearEnd;
    const double axisLen = axis.norm();
    const double toPointLen = toPoint.norm();
    if (toPointLen <= DDAP_TINY_FLOAT) {
        return 0.;
    }
    const double cosAngle = clampValue(axis.dot(toPoint) / (axisLen * toPointLen), -1., 1.);
    return std::acos(cosAngle) * RAD_TO_DEG;
}

unsigned long long HistogramDistribution::GetTotalCount() const {
    unsigned long long total = 0;
    for (const auto c : counts) {
        total += c;
    }
    return total;
}

HistogramDistribution MakeHistogram(const std::vector<double>& values,
                                    double lo,
                                    double hi,
                                    unsigned int num_bins,
                                    bool closeLastBin) {
    if (num_bins == 0) {
        DDAP_ERROR("A histogram needs at least one bin.");
    }
    if (!(hi > lo)) {
        DDAP_ERROR("Histogram range [%f, %f] is empty.", lo, hi);
    }
    HistogramDistribution hist;
    hist.counts.assign(num_bins, 0);
    hist.bin_edges.resize(num_bins + 1);
    const double width = (hi - lo) / (double)num_bins;
    for (unsigned int i = 0; i < num_bins; i++) {
        hist.bin_edges[i] = lo + width * (double)i;
    }
    hist.bin_edges[num_bins] = hi;

    for (const double v : values) {
        if (!isBetween(v, lo, hi))
            continue;
        if (v == hi) {
            if (closeLastBin)
                hist.counts[num_bins - 1]++;
            continue;
        }
        long long idx = (long long)((v - lo) / width);
        idx = clampValue<long long>(idx, 0, (long long)num_bins - 1);
        // Make the bin assignment agree with the stored edges
        if (v < hist.bin_edges[idx] && idx > 0)
            idx--;
        else if (idx + 1 < (long long)num_bins && v >= hist.bin_edges[idx + 1])
            idx++;
        hist.counts[idx]++;
    }
    return hist;
}

double CenterDistance(const Shape& a, const Shape& b) {
    return CenterDistance(a, real3_t::Zero(), b);
}

double CenterDistance(const Shape& a, const real3_t& offset, const Shape& b) {
    if (a.GetType() == SHAPE_TYPE::SPHERE) {
        const real3_t pa = a.GetCenterPoint() + offset;
        if (b.GetType() == SHAPE_TYPE::SPHERE)
            return Distance(pa, b.GetCenterPoint());
        return Distance(pa, b.GetCenterSegment());
    }
    const Segment sa(a.GetCenterSegment().p1 + offset, a.GetCenterSegment().p2 + offset);
    if (b.GetType() == SHAPE_TYPE::SPHERE)
        return Distance(sa, b.GetCenterPoint());
    return Distance(sa, b.GetCenterSegment());
}

std::map<std::string, HistogramDistribution> EvaluateDistribution(
    const std::vector<std::shared_ptr<const Shape>>& bodies) {
    std::vector<std::shared_ptr<const Shape>> spheres, rods;
    double sphereRadii = 0., rodRadii = 0.;
    for (const auto& body : bodies) {
        if (body->GetType() == SHAPE_TYPE::SPHERE) {
            spheres.push_back(body);
            sphereRadii += body->GetRadius();
        } else {
            rods.push_back(body);
            rodRadii += body->GetRadius();
        }
    }

    std::map<std::string, HistogramDistribution> res;
    if (bodies.empty())
        return res;

    const double radius = (spheres.size() > 0) ? sphereRadii / (double)spheres.size() : rodRadii / (double)rods.size();
    const double distLo = DIST_HIST_LOWER_RADII * radius;
    const double distHi = DIST_HIST_UPPER_RADII * radius;

    if (spheres.size() > 0 && rods.size() > 0) {
        std::vector<double> angles, distSR;
        angles.reserve(spheres.size() * rods.size());
        distSR.reserve(spheres.size() * rods.size());
        for (const auto& sphere : spheres) {
            for (const auto& rod : rods) {
                angles.push_back(AngleToSegment(sphere->GetCenterPoint(), rod->GetCenterSegment()));
                distSR.push_back(Distance(sphere->GetCenterPoint(), rod->GetCenterSegment()));
            }
        }
        res[DIST_SPHERE_ROD_ANGLE] = MakeHistogram(angles, 0., ANGLE_HIST_MAX_DEG, ANGLE_HIST_NUM_BINS);
        res[DIST_SPHERE_ROD] = MakeHistogram(distSR, distLo, distHi, DIST_HIST_NUM_BINS);
    }
    if (spheres.size() > 1) {
        std::vector<double> distSS;
        for (size_t i = 0; i < spheres.size(); i++) {
            for (size_t j = i + 1; j < spheres.size(); j++) {
                distSS.push_back(CenterDistance(*spheres[i], *spheres[j]));
            }
        }
        res[DIST_SPHERE_SPHERE] = MakeHistogram(distSS, distLo, distHi, DIST_HIST_NUM_BINS);
    }
    if (rods.size() > 1) {
        std::vector<double> distRR;
        for (size_t i = 0; i < rods.size(); i++) {
            for (size_t j = i + 1; j < rods.size(); j++) {
                distRR.push_back(CenterDistance(*rods[i], *rods[j]));
            }
        }
        res[DIST_ROD_ROD] = MakeHistogram(distRR, distLo, distHi, DIST_HIST_NUM_BINS);
    }
    return res;
}

HistogramDistribution EvaluateCenterDistribution(const std::vector<std::shared_ptr<const Shape>>& bodies,
                                                 double cloud_radius) {
    if (!(cloud_radius > 0.)) {
        DDAP_ERROR("Center distribution needs a positive cloud radius, got %f.", cloud_radius);
    }
    std::vector<double> dists;
    for (size_t i = 0; i < bodies.size(); i++) {
        for (size_t j = i + 1; j < bodies.size(); j++) {
            dists.push_back(CenterDistance(*bodies[i], *bodies[j]));
        }
    }
    return MakeHistogram(dists, 0., 2. * cloud_radius, CENTER_DIST_HIST_NUM_BINS, false);
}

}  // namespace ddap
