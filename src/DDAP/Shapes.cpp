//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <cmath>

#include "Shapes.h"
#include "HostSideHelpers.hpp"
#include "../core/utils/Logger.hpp"

namespace ddap {

Shape::Shape(double radius) : m_radius(radius) {
    if (!(radius > 0.)) {
        DDAP_ERROR("Shape radius must be positive, got %f.", radius);
    }
}

std::vector<lattice3_t> Shape::Discretize(const LatticeSampler& sampler) const {
    const std::vector<lattice3_t> local = sampler.Sample(*this);
    std::vector<lattice3_t> dipoles(local.size());
    for (size_t i = 0; i < local.size(); i++) {
        dipoles[i] = roundToLattice(LocalToGlobal(local[i].cast<double>()));
    }
    return hostUniqueLattice(dipoles);
}

std::vector<lattice3_t> Shape::Discretize() const {
    return Discretize(BoxScanSampler());
}

// =============================================================================
// Sphere
// =============================================================================

Sphere::Sphere(double radius) : Shape(radius) {}

double Sphere::GetVolume() const {
    return FOUR_OVER_THREE * PI * m_radius * m_radius * m_radius;
}

bool Sphere::PointInside(const real3_t& p) const {
    return p.squaredNorm() <= m_radius * m_radius;
}

lattice3_t Sphere::LocalLatticeExtent() const {
    const int r = (int)std::ceil(m_radius);
    return lattice3_t(r, r, r);
}

double Sphere::SliceRadiusSquared(double z) const {
    return m_radius * m_radius - z * z;
}

// =============================================================================
// Rod
// =============================================================================

Rod::Rod(double radius, double height, const eulerAngles_t& rotation) : Shape(radius), m_height(height) {
    assertDimensions();
    setRotation(rotation);
}

Rod::Rod(double radius, double height, randomEngine_t& re) : Shape(radius), m_height(height) {
    assertDimensions();
    setRotation(SampleEulerAngles(re));
}

void Rod::assertDimensions() const {
    if (!(m_height > 2. * m_radius)) {
        DDAP_ERROR("Rod height (%f) must be larger than twice its radius (%f).", m_height, m_radius);
    }
}

void Rod::setRotation(const eulerAngles_t& rotation) {
    for (int i = 0; i < 3; i++) {
        if (!std::isfinite(rotation[i])) {
            DDAP_ERROR("Rod rotation angles must be finite.");
        }
        m_rotation[i] = wrapDegrees(rotation[i]);
    }
    m_rotMat = EulerRotationMatrix(m_rotation);
    const double halfAxis = GetHalfAxisLength();
    m_axisEnd1 = m_rotMat * real3_t(0., 0., halfAxis);
    m_axisEnd2 = m_rotMat * real3_t(0., 0., -halfAxis);
}

double Rod::GetVolume() const {
    const double tips = FOUR_OVER_THREE * PI * m_radius * m_radius * m_radius;
    const double cylinder = PI * m_radius * m_radius * (m_height - 2. * m_radius);
    return tips + cylinder;
}

Segment Rod::GetCenterSegment() const {
    return Segment(m_axisEnd1 + m_position, m_axisEnd2 + m_position);
}

real3_t Rod::GetLocalCenterMin() const {
    return m_axisEnd1.cwiseMin(m_axisEnd2);
}

real3_t Rod::GetLocalCenterMax() const {
    return m_axisEnd1.cwiseMax(m_axisEnd2);
}

bool Rod::PointInside(const real3_t& p) const {
    const double halfAxis = GetHalfAxisLength();
    const double r2 = m_radius * m_radius;
    // Cylindrical part
    if (p.x() * p.x() + p.y() * p.y() <= r2 && std::abs(p.z()) <= halfAxis) {
        return true;
    }
    // Either tip
    const real3_t cap(0., 0., halfAxis);
    return (p - cap).squaredNorm() <= r2 || (p + cap).squaredNorm() <= r2;
}

lattice3_t Rod::LocalLatticeExtent() const {
    const int r = (int)std::ceil(m_radius);
    return lattice3_t(r, r, (int)std::ceil(m_height / 2.));
}

double Rod::SliceRadiusSquared(double z) const {
    const double halfAxis = GetHalfAxisLength();
    const double az = std::abs(z);
    if (az <= halfAxis) {
        return m_radius * m_radius;
    }
    const double dz = az - halfAxis;
    return m_radius * m_radius - dz * dz;
}

// =============================================================================
// Factory
// =============================================================================

SHAPE_TYPE ParseShapeType(const std::string& name) {
    switch (hash_charr(str_to_upper(name).c_str())) {
        case ("SPHERE"_):
            return SHAPE_TYPE::SPHERE;
        case ("ROD"_):
            return SHAPE_TYPE::ROD;
        default:
            DDAP_ERROR("Shape type %s is unknown. Please select from sphere and rod.", name.c_str());
    }
}

std::shared_ptr<Shape> CreateShape(SHAPE_TYPE type,
                                   const std::vector<double>& params,
                                   const std::optional<eulerAngles_t>& rotation,
                                   randomEngine_t& re) {
    switch (type) {
        case SHAPE_TYPE::SPHERE:
            if (params.size() < 1) {
                DDAP_ERROR("A sphere needs its radius as the shape parameter.");
            }
            return std::make_shared<Sphere>(params[0]);
        case SHAPE_TYPE::ROD:
            if (params.size() < 2) {
                DDAP_ERROR("A rod needs [radius, height] as the shape parameters, but %zu value(s) were given.",
                           params.size());
            }
            if (rotation.has_value()) {
                return std::make_shared<Rod>(params[0], params[1], *rotation);
            }
            return std::make_shared<Rod>(params[0], params[1], re);
        default:
            DDAP_ERROR("Unknown shape type.");
    }
}

std::shared_ptr<Shape> CreateShape(const std::string& type,
                                   const std::vector<double>& params,
                                   const std::optional<eulerAngles_t>& rotation,
                                   randomEngine_t& re) {
    return CreateShape(ParseShapeType(type), params, rotation, re);
}

}  // namespace ddap
