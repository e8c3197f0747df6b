//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_VAR_TYPES
#define DDAP_VAR_TYPES

#include <array>
#include <cstdint>
#include <random>

#include <Eigen/Dense>

namespace ddap {

typedef Eigen::Vector3d real3_t;     ///< Continuous coordinates, in dipole units unless stated otherwise
typedef Eigen::Vector3i lattice3_t;  ///< Integer dipole lattice coordinates
typedef Eigen::Matrix3d rotMat_t;

typedef std::array<double, 3> eulerAngles_t;  ///< Rotations about x, y, z, in degrees

typedef unsigned int bodyID_t;
typedef unsigned int materialIdx_t;  ///< Material tag handed to the solver (1-based)

// Every stochastic routine takes one of these by reference; nothing draws from a global source
typedef std::mt19937 randomEngine_t;

}  // namespace ddap

#endif
