//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_MISC_DEFINES
#define DDAP_MISC_DEFINES

#include <stdint.h>
#include <string>

#include "VariableTypes.h"

#define DDAP_MIN(a, b) ((a < b) ? a : b)
#define DDAP_MAX(a, b) ((a > b) ? a : b)

namespace ddap {
// =============================================================================
// CONSTANTS USED BY THE PACKING AND DISCRETIZATION MODULES
// =============================================================================
#define DDAP_TINY_FLOAT 1e-12

// A few pre-computed constants
constexpr double FOUR_OVER_THREE = 4. / 3.;
constexpr double ONE_OVER_THREE = 1. / 3.;
constexpr double PI = 3.1415926535897932385;
constexpr double DEG_TO_RAD = PI / 180.;
constexpr double RAD_TO_DEG = 180. / PI;

/// Consecutive rejected trials tolerated for one body before a placement pass is abandoned
constexpr unsigned int DEFAULT_MAX_PLACEMENT_TRIALS = 500;
/// Largest particle-count denominator considered when matching two families' volume-fraction ratio
constexpr unsigned int MAX_CELL_RATIO_DENOMINATOR = 20;
// Upper bound on N1 + N2 for a cell-to-ensemble cell
constexpr unsigned int MAX_BODIES_PER_CELL = 10000;
/// Clearance (dipole units) added to the radii sum when two bodies share a cell
constexpr double CELL_CLEARANCE = 1.;

// Histogram layout of the pairwise distributions
constexpr unsigned int ANGLE_HIST_NUM_BINS = 36;
constexpr double ANGLE_HIST_MAX_DEG = 180.;
constexpr unsigned int DIST_HIST_NUM_BINS = 78;
constexpr double DIST_HIST_LOWER_RADII = 2.;
constexpr double DIST_HIST_UPPER_RADII = 80.;
constexpr unsigned int CENTER_DIST_HIST_NUM_BINS = 20;

// Names of the distribution categories
const std::string DIST_SPHERE_ROD_ANGLE = "sphere-rod-angle";
const std::string DIST_SPHERE_ROD = "sphere-rod";
const std::string DIST_SPHERE_SPHERE = "sphere-sphere";
const std::string DIST_ROD_ROD = "rod-rod";

/// Shape primitives a body can be
enum class SHAPE_TYPE { SPHERE, ROD };

/// How an ensemble is populated
enum class PLACEMENT_STRATEGY {
    CELL_TO_ENSEMBLE,   ///< Tile the cloud with cells holding a fixed particle-count ratio, per-cell collision check
    VOLUME_TO_ENSEMBLE  ///< Fill each family's target volume inside an oversized ball, cloud-wide collision check
};

inline std::string ShapeTypeName(SHAPE_TYPE type) {
    return (type == SHAPE_TYPE::SPHERE) ? "sphere" : "rod";
}

inline std::string PlacementStrategyName(PLACEMENT_STRATEGY option) {
    return (option == PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE) ? "cell-to-ensemble" : "volume-to-ensemble";
}

}  // namespace ddap

#endif
