//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_SHAPES_H
#define DDAP_SHAPES_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Defines.h"
#include "Geometry.h"
#include "utils/Samplers.hpp"

namespace ddap {

/// @brief Base class of the bodies an ensemble is made of.
/// @details A shape is defined in its local frame around the origin. Its position is the cumulative translation
/// applied with Move(); for rods, the fixed construction-time rotation is applied before that translation.
class Shape : public LatticeSolid {
  public:
    virtual ~Shape() {}

    virtual SHAPE_TYPE GetType() const = 0;
    std::string GetTypeName() const { return ShapeTypeName(GetType()); }

    double GetRadius() const { return m_radius; }
    /// Closed-form volume, in dipole units cubed.
    virtual double GetVolume() const = 0;
    /// Full end-to-end length of a rod; empty for spheres.
    virtual std::optional<double> GetLength() const { return std::nullopt; }
    /// Euler angles (degrees) of a rod; empty for spheres.
    virtual std::optional<eulerAngles_t> GetRotation() const { return std::nullopt; }

    /// Translate the body. Translations accumulate.
    void Move(const real3_t& displacement) { m_position += displacement; }
    const real3_t& GetPosition() const { return m_position; }

    /// The sphere center or the rod axis midpoint.
    real3_t GetCenterPoint() const { return m_position; }
    /// The rotated, translated cylindrical axis of a rod; a zero-length segment at the center for spheres.
    virtual Segment GetCenterSegment() const { return Segment(m_position, m_position); }
    /// Half of the cylindrical axis length (0 for spheres).
    virtual double GetHalfAxisLength() const { return 0.; }
    /// Distance from the center point to the farthest point of the body.
    double GetBoundingRadius() const { return GetHalfAxisLength() + m_radius; }

    /// Component-wise lower and upper bounds of the center geometry, relative to the current position.
    virtual real3_t GetLocalCenterMin() const { return real3_t::Zero(); }
    virtual real3_t GetLocalCenterMax() const { return real3_t::Zero(); }

    /// @brief Integer dipole coordinates occupied by this body.
    /// @details Lattice points inside the local shape are rotated (rods), translated by the current position, rounded
    /// to the nearest lattice node and deduplicated. The result is sorted.
    std::vector<lattice3_t> Discretize(const LatticeSampler& sampler) const;
    std::vector<lattice3_t> Discretize() const;

    /// Map a local-frame point to the global frame.
    virtual real3_t LocalToGlobal(const real3_t& p) const { return p + m_position; }

    virtual std::shared_ptr<Shape> Clone() const = 0;

    void SetMaterial(const std::string& material) { m_material = material; }
    const std::string& GetMaterial() const { return m_material; }
    void SetMaterialIndex(materialIdx_t idx) { m_materialIdx = idx; }
    materialIdx_t GetMaterialIndex() const { return m_materialIdx; }

  protected:
    Shape(double radius);

    double m_radius;
    real3_t m_position = real3_t::Zero();
    std::string m_material;
    materialIdx_t m_materialIdx = 1;
};

/// Solid sphere.
class Sphere : public Shape {
  public:
    Sphere(double radius);

    virtual SHAPE_TYPE GetType() const override { return SHAPE_TYPE::SPHERE; }
    virtual double GetVolume() const override;

    virtual bool PointInside(const real3_t& p) const override;
    virtual lattice3_t LocalLatticeExtent() const override;
    virtual double SliceRadiusSquared(double z) const override;

    virtual std::shared_ptr<Shape> Clone() const override { return std::make_shared<Sphere>(*this); }
};

/// Spherocylinder: a cylinder of length height - 2 * radius capped by two hemispheres, aligned with the local z axis
/// and then rotated about x, y and z.
class Rod : public Shape {
  public:
    /// Rod with an explicit orientation. Angles are wrapped into [0, 360).
    Rod(double radius, double height, const eulerAngles_t& rotation);
    /// Rod with an orientation drawn uniformly from [0, 360)^3.
    Rod(double radius, double height, randomEngine_t& re);

    virtual SHAPE_TYPE GetType() const override { return SHAPE_TYPE::ROD; }
    virtual double GetVolume() const override;
    virtual std::optional<double> GetLength() const override { return m_height; }
    virtual std::optional<eulerAngles_t> GetRotation() const override { return m_rotation; }

    double GetHeight() const { return m_height; }

    virtual Segment GetCenterSegment() const override;
    virtual double GetHalfAxisLength() const override { return m_height / 2. - m_radius; }
    virtual real3_t GetLocalCenterMin() const override;
    virtual real3_t GetLocalCenterMax() const override;

    virtual bool PointInside(const real3_t& p) const override;
    virtual lattice3_t LocalLatticeExtent() const override;
    virtual double SliceRadiusSquared(double z) const override;

    virtual real3_t LocalToGlobal(const real3_t& p) const override { return m_rotMat * p + m_position; }

    virtual std::shared_ptr<Shape> Clone() const override { return std::make_shared<Rod>(*this); }

  private:
    void assertDimensions() const;
    void setRotation(const eulerAngles_t& rotation);

    double m_height;
    eulerAngles_t m_rotation;
    rotMat_t m_rotMat;
    // Rotated axis endpoints, relative to the position
    real3_t m_axisEnd1;
    real3_t m_axisEnd2;
};

/// @brief Build a shape from its type and parameter list ([radius] or [radius, height]).
/// @details A rod without an explicit rotation draws one from the engine. Invalid parameters throw DDAPException.
std::shared_ptr<Shape> CreateShape(SHAPE_TYPE type,
                                   const std::vector<double>& params,
                                   const std::optional<eulerAngles_t>& rotation,
                                   randomEngine_t& re);
/// Same as above, with the shape given by name ("sphere" or "rod", case-insensitive).
std::shared_ptr<Shape> CreateShape(const std::string& type,
                                   const std::vector<double>& params,
                                   const std::optional<eulerAngles_t>& rotation,
                                   randomEngine_t& re);

/// Parse a shape name ("sphere" or "rod", case-insensitive).
SHAPE_TYPE ParseShapeType(const std::string& name);

}  // namespace ddap

#endif
