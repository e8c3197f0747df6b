//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_HOST_HELPERS
#define DDAP_HOST_HELPERS

#include <iostream>
#include <sstream>
#include <cmath>
#include <vector>
#include <algorithm>
#include <string>
#include <utility>
#include <stdexcept>
#include <limits>

#include "Defines.h"
#include "VariableTypes.h"
#include "../core/utils/Logger.hpp"

namespace ddap {

template <typename T>
inline bool isBetween(const T& x, const T& L, const T& U) {
    if (x < L) {
        return false;
    }
    if (x > U) {
        return false;
    }
    return true;
}

template <typename T>
inline T clampValue(const T& x, const T& L, const T& U) {
    return (x < L) ? L : ((x > U) ? U : x);
}

/// Lexicographic (x, then y, then z) ordering of lattice points, so they can be sorted and deduplicated.
struct LatticeLess {
    bool operator()(const lattice3_t& a, const lattice3_t& b) const {
        if (a.x() != b.x())
            return a.x() < b.x();
        if (a.y() != b.y())
            return a.y() < b.y();
        return a.z() < b.z();
    }
};

/// Sort a list of lattice points and drop the duplicates.
inline std::vector<lattice3_t> hostUniqueLattice(const std::vector<lattice3_t>& vec) {
    std::vector<lattice3_t> unique_vec(vec);
    // Need sort first!
    std::sort(unique_vec.begin(), unique_vec.end(), LatticeLess());
    auto tmp_it = std::unique(unique_vec.begin(), unique_vec.end(),
                              [](const lattice3_t& a, const lattice3_t& b) { return a == b; });
    unique_vec.resize(std::distance(unique_vec.begin(), tmp_it));
    return unique_vec;
}

/// Round a continuous coordinate to the nearest lattice node.
inline lattice3_t roundToLattice(const real3_t& p) {
    return lattice3_t((int)std::lround(p.x()), (int)std::lround(p.y()), (int)std::lround(p.z()));
}

/// Change all characters in a string to upper case.
inline std::string str_to_upper(const std::string& input) {
    std::string output = input;
    std::transform(input.begin(), input.end(), output.begin(), ::toupper);
    return output;
}

// A smaller hasher that helps switch on option strings. Contribution from Nick and hare1039 on Stackoverflow,
// https://stackoverflow.com/questions/650162/why-cant-the-switch-statement-be-applied-on-strings.
constexpr unsigned int hash_charr(const char* s, int off = 0) {
    return !s[off] ? 7001 : (hash_charr(s, off + 1) * 33) ^ s[off];
}
constexpr inline unsigned int operator"" _(const char* s, size_t) {
    return hash_charr(s);
}

/// Map any angle (degrees) into [0, 360).
inline double wrapDegrees(double deg) {
    double res = std::fmod(deg, 360.);
    if (res < 0.)
        res += 360.;
    // fmod of a tiny negative number can land exactly on 360 after the shift
    if (res >= 360.)
        res = 0.;
    return res;
}

/// @brief Euler rotation matrix for the x, then y, then z rotation used throughout the package.
/// @details Points are treated as row vectors and right-multiplied: p' = p * Rx * Ry * Rz. The returned matrix M
/// satisfies p' = M * p for column vectors, i.e. M = (Rx * Ry * Rz)^T.
inline rotMat_t EulerRotationMatrix(const eulerAngles_t& angles) {
    const double ax = angles[0] * DEG_TO_RAD;
    const double ay = angles[1] * DEG_TO_RAD;
    const double az = angles[2] * DEG_TO_RAD;

    rotMat_t Rx, Ry, Rz;
    Rx << 1, 0, 0,                         //
        0, std::cos(ax), -std::sin(ax),    //
        0, std::sin(ax), std::cos(ax);
    Ry << std::cos(ay), 0, std::sin(ay),   //
        0, 1, 0,                           //
        -std::sin(ay), 0, std::cos(ay);
    Rz << std::cos(az), -std::sin(az), 0,  //
        std::sin(az), std::cos(az), 0,     //
        0, 0, 1;

    return (Rx * (Ry * Rz)).transpose();
}

/// Rotate one point about x, then y, then z (angles in degrees).
inline real3_t RotateEuler(const real3_t& point, const eulerAngles_t& angles) {
    return EulerRotationMatrix(angles) * point;
}

/// Rotate a set of points about x, then y, then z (angles in degrees).
inline std::vector<real3_t> RotateEuler(const std::vector<real3_t>& points, const eulerAngles_t& angles) {
    const rotMat_t M = EulerRotationMatrix(angles);
    std::vector<real3_t> res(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        res[i] = M * points[i];
    }
    return res;
}

/// @brief Best rational approximation p/q of a positive real with q <= max_denom.
/// @details Walks the continued-fraction convergents of x and, once the next convergent would exceed the
/// denominator bound, picks the closer of the last convergent and the best semiconvergent (the last convergent wins
/// ties). Inputs whose numerators could overflow long long throw DDAPException.
inline std::pair<long long, long long> BestRationalApproximation(double x, long long max_denom) {
    if (max_denom < 1) {
        DDAP_ERROR("The denominator bound of a rational approximation must be at least 1, got %lld.", max_denom);
    }
    if (!std::isfinite(x) || x < 0. ||
        x * (double)(max_denom + 1) >= (double)std::numeric_limits<long long>::max()) {
        DDAP_ERROR("Cannot approximate %g by a fraction with denominator at most %lld.", x, max_denom);
    }
    long long p0 = 0, q0 = 1, p1 = 1, q1 = 0;
    double rem = x;
    for (int iter = 0; iter < 64; iter++) {
        const double a_real = std::floor(rem);
        // Such a term already pushes the denominator past the bound
        if (q1 > 0 && a_real > (double)max_denom)
            break;
        const long long a = (long long)a_real;
        const long long q2 = q0 + a * q1;
        if (q2 > max_denom)
            break;
        const long long p2 = p0 + a * p1;
        p0 = p1;
        q0 = q1;
        p1 = p2;
        q1 = q2;
        const double frac = rem - a_real;
        if (frac <= DDAP_TINY_FLOAT * DDAP_MAX(1., rem)) {
            return {p1, q1};
        }
        rem = 1. / frac;
    }
    const long long k = (max_denom - q0) / q1;
    const double bound1 = (double)(p0 + k * p1) / (double)(q0 + k * q1);
    const double bound2 = (double)p1 / (double)q1;
    if (std::abs(bound2 - x) <= std::abs(bound1 - x)) {
        return {p1, q1};
    }
    return {p0 + k * p1, q0 + k * q1};
}

template <typename T>
inline real3_t VecToReal3(const std::vector<T>& vec) {
    return real3_t((double)vec.at(0), (double)vec.at(1), (double)vec.at(2));
}

inline std::vector<double> Real3ToVec(const real3_t& vec) {
    return {vec.x(), vec.y(), vec.z()};
}

inline std::vector<std::vector<int>> LatticeVectorToVecOfVec(const std::vector<lattice3_t>& vec) {
    std::vector<std::vector<int>> res(vec.size());
    for (size_t i = 0; i < vec.size(); i++) {
        res[i] = {vec[i].x(), vec[i].y(), vec[i].z()};
    }
    return res;
}

// Asserters (for the convenience of Python wrapper)
template <typename T>
inline void assertThreeElements(const std::vector<T>& vec, const std::string& func_name, const std::string& var_name) {
    if (vec.size() != 3) {
        std::stringstream out;
        out << func_name << "'s " << var_name
            << " argument needs to be, or be composed of, length-3 lists/vectors. The provided size is " << vec.size()
            << ".\n";
        throw std::runtime_error(out.str());
    }
}

}  // namespace ddap

#endif
