//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include "catch2/catch.hpp"

#include <DDAP/Shapes.h>
#include <DDAP/HostSideHelpers.hpp>
#include <core/utils/Logger.hpp>

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

using namespace ddap;

namespace {

bool containsPoint(const std::vector<lattice3_t>& points, const lattice3_t& p) {
    return std::binary_search(points.begin(), points.end(), p, LatticeLess());
}

}  // namespace

TEST_CASE("Sphere", "[Shapes]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);

    SECTION("Containment") {
        Sphere sphere(2.5);
        CHECK(sphere.PointInside(real3_t(0, 0, 0)));
        CHECK(sphere.PointInside(real3_t(2.5, 0, 0)));
        CHECK_FALSE(sphere.PointInside(real3_t(2.5 + 1e-9, 0, 0)));
        CHECK_FALSE(sphere.PointInside(real3_t(2, 2, 0)));
    }

    SECTION("Volume and type") {
        Sphere sphere(2.);
        CHECK(sphere.GetVolume() == Approx(4. / 3. * PI * 8.));
        CHECK(sphere.GetType() == SHAPE_TYPE::SPHERE);
        CHECK(sphere.GetTypeName() == "sphere");
        CHECK_FALSE(sphere.GetLength().has_value());
        CHECK_FALSE(sphere.GetRotation().has_value());
        CHECK(sphere.GetBoundingRadius() == 2.);
    }

    SECTION("Translations accumulate") {
        Sphere sphere(1.);
        sphere.Move(real3_t(1, 2, 3));
        sphere.Move(real3_t(-2, 0, 1));
        CHECK(sphere.GetPosition().isApprox(real3_t(-1, 2, 4)));
        CHECK(sphere.GetCenterPoint().isApprox(real3_t(-1, 2, 4)));
        const Segment c = sphere.GetCenterSegment();
        CHECK(c.Length() == 0);
    }

    SECTION("Unit sphere lattice") {
        Sphere sphere(1.);
        auto dipoles = sphere.Discretize();
        CHECK(dipoles.size() == 7);
        CHECK(containsPoint(dipoles, lattice3_t(0, 0, 0)));
        CHECK(containsPoint(dipoles, lattice3_t(0, 0, -1)));
        CHECK_FALSE(containsPoint(dipoles, lattice3_t(1, 1, 0)));
    }

    SECTION("Lattice at the origin is symmetric and fills the volume") {
        const double R = 10.;
        Sphere sphere(R);
        auto dipoles = sphere.Discretize();
        CHECK((double)dipoles.size() == Approx(4. / 3. * PI * R * R * R).epsilon(0.03));
        for (const auto& p : dipoles) {
            CHECK(containsPoint(dipoles, lattice3_t(-p.x(), p.y(), p.z())));
            CHECK(containsPoint(dipoles, lattice3_t(p.x(), -p.y(), p.z())));
            CHECK(containsPoint(dipoles, lattice3_t(p.x(), p.y(), -p.z())));
        }
    }

    SECTION("Lattice follows integer translations") {
        Sphere a(3.), b(3.);
        b.Move(real3_t(10, -3, 2));
        auto pa = a.Discretize();
        auto pb = b.Discretize();
        REQUIRE(pa.size() == pb.size());
        for (size_t i = 0; i < pa.size(); i++) {
            CHECK(pb[i] == lattice3_t(pa[i] + lattice3_t(10, -3, 2)));
        }
    }

    SECTION("Invalid radius") {
        CHECK_THROWS_AS(Sphere(0.), DDAPException);
        CHECK_THROWS_AS(Sphere(-1.), DDAPException);
    }
}

TEST_CASE("Rod", "[Shapes]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);

    SECTION("Geometry without rotation") {
        Rod rod(1., 4., eulerAngles_t{0, 0, 0});
        const Segment axis = rod.GetCenterSegment();
        CHECK(axis.p1.isApprox(real3_t(0, 0, 1)));
        CHECK(axis.p2.isApprox(real3_t(0, 0, -1)));
        CHECK(rod.GetVolume() == Approx(4. / 3. * PI + PI * 2.));
        CHECK(rod.GetHalfAxisLength() == 1.);
        CHECK(rod.GetBoundingRadius() == 2.);
        CHECK(*rod.GetLength() == 4.);
    }

    SECTION("Containment") {
        Rod rod(1., 4., eulerAngles_t{0, 0, 0});
        CHECK(rod.PointInside(real3_t(0, 0, 0)));
        CHECK(rod.PointInside(real3_t(1, 0, 1)));
        CHECK(rod.PointInside(real3_t(0, 0, 2)));
        CHECK_FALSE(rod.PointInside(real3_t(0, 0, 2.01)));
        CHECK_FALSE(rod.PointInside(real3_t(1, 0, 1.5)));
        CHECK_FALSE(rod.PointInside(real3_t(1.01, 0, 0)));
    }

    SECTION("Rotations are applied about x, then y, then z") {
        Rod rx(1., 6., eulerAngles_t{90, 0, 0});
        CHECK(rx.GetCenterSegment().p1.isApprox(real3_t(0, 2, 0), 1e-12));
        Rod ry(1., 6., eulerAngles_t{0, 90, 0});
        CHECK(ry.GetCenterSegment().p1.isApprox(real3_t(-2, 0, 0), 1e-12));
        // x first sends the axis to +y, then z turns +y into +x
        Rod rxz(1., 6., eulerAngles_t{90, 0, 90});
        CHECK((rxz.GetCenterSegment().p1 - real3_t(2, 0, 0)).norm() < 1e-12);
        CHECK(RotateEuler(real3_t(0, 0, 2), eulerAngles_t{90, 0, 90}).isApprox(rxz.GetCenterSegment().p1));
    }

    SECTION("Rotation is fixed at construction; moves only translate") {
        Rod rod(1., 6., eulerAngles_t{30, 40, 50});
        const Segment before = rod.GetCenterSegment();
        rod.Move(real3_t(5, 5, 5));
        rod.Move(real3_t(-1, 0, 2));
        const Segment after = rod.GetCenterSegment();
        CHECK((after.p1 - before.p1).isApprox(real3_t(4, 5, 7)));
        CHECK((after.p2 - before.p2).isApprox(real3_t(4, 5, 7)));
        CHECK(after.Midpoint().isApprox(rod.GetCenterPoint()));
        CHECK(after.Length() == Approx(4));
    }

    SECTION("Angles are wrapped into [0, 360)") {
        Rod rod(1., 4., eulerAngles_t{-90, 370, 720});
        const eulerAngles_t rot = *rod.GetRotation();
        CHECK(rot[0] == Approx(270));
        CHECK(rot[1] == Approx(10));
        CHECK(rot[2] == Approx(0).margin(1e-12));
    }

    SECTION("Random orientation comes from the supplied engine") {
        randomEngine_t re1(123), re2(123);
        Rod a(1., 4., re1), b(1., 4., re2);
        const eulerAngles_t ra = *a.GetRotation();
        const eulerAngles_t rb = *b.GetRotation();
        for (int i = 0; i < 3; i++) {
            CHECK(ra[i] == rb[i]);
            CHECK(ra[i] >= 0);
            CHECK(ra[i] < 360);
        }
    }

    SECTION("Local center bounds") {
        Rod rod(1., 6., eulerAngles_t{0, 90, 0});
        CHECK(rod.GetLocalCenterMin().isApprox(real3_t(-2, 0, 0), 1e-12));
        CHECK((rod.GetLocalCenterMax() - real3_t(2, 0, 0)).norm() < 1e-12);
    }

    SECTION("Lattice") {
        Rod rod(1., 4., eulerAngles_t{0, 0, 0});
        auto dipoles = rod.Discretize();
        // 3 layers of 5 in the cylinder plus one tip node on each end
        CHECK(dipoles.size() == 17);
        CHECK(containsPoint(dipoles, lattice3_t(0, 0, 2)));
        CHECK(containsPoint(dipoles, lattice3_t(0, 0, -2)));
        CHECK_FALSE(containsPoint(dipoles, lattice3_t(1, 0, 2)));

        // A right-angle turn maps the lattice onto itself
        Rod turned(1., 4., eulerAngles_t{90, 0, 0});
        auto turnedDipoles = turned.Discretize();
        CHECK(turnedDipoles.size() == 17);
        CHECK(containsPoint(turnedDipoles, lattice3_t(0, 2, 0)));
        CHECK(containsPoint(turnedDipoles, lattice3_t(0, -2, 0)));
    }

    SECTION("Invalid dimensions") {
        CHECK_THROWS_AS(Rod(1., 2., eulerAngles_t{0, 0, 0}), DDAPException);
        CHECK_THROWS_AS(Rod(1., 1.5, eulerAngles_t{0, 0, 0}), DDAPException);
        CHECK_THROWS_AS(Rod(0., 4., eulerAngles_t{0, 0, 0}), DDAPException);
        CHECK_THROWS_AS(Rod(-1., 4., eulerAngles_t{0, 0, 0}), DDAPException);
    }
}

TEST_CASE("Shape factory", "[Shapes]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    randomEngine_t re(1);

    SECTION("Names are case-insensitive") {
        CHECK(ParseShapeType("sphere") == SHAPE_TYPE::SPHERE);
        CHECK(ParseShapeType("Rod") == SHAPE_TYPE::ROD);
        CHECK_THROWS_AS(ParseShapeType("cube"), DDAPException);
    }

    SECTION("Parameters") {
        auto sphere = CreateShape("sphere", {2.}, std::nullopt, re);
        CHECK(sphere->GetType() == SHAPE_TYPE::SPHERE);
        CHECK(sphere->GetRadius() == 2.);
        auto rod = CreateShape(SHAPE_TYPE::ROD, {1., 5.}, eulerAngles_t{10, 20, 30}, re);
        CHECK(rod->GetType() == SHAPE_TYPE::ROD);
        CHECK((*rod->GetRotation())[1] == Approx(20));

        CHECK_THROWS_AS(CreateShape("sphere", {}, std::nullopt, re), DDAPException);
        CHECK_THROWS_AS(CreateShape("rod", {1.}, std::nullopt, re), DDAPException);
        CHECK_THROWS_AS(CreateShape("rod", {1., 2.}, std::nullopt, re), DDAPException);
    }

    SECTION("Clones are independent") {
        auto rod = CreateShape("rod", {1., 5.}, std::nullopt, re);
        auto copy = rod->Clone();
        copy->Move(real3_t(1, 0, 0));
        CHECK(rod->GetPosition().isApprox(real3_t::Zero()));
        CHECK(copy->GetPosition().isApprox(real3_t(1, 0, 0)));
        CHECK(*copy->GetRotation() == *rod->GetRotation());
    }
}

TEST_CASE("Lattice samplers", "[Samplers]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    BoxScanSampler box;
    SliceScanSampler slice;
    CHECK(box.GetType() == LATTICE_SAMPLER::BOX_SCAN);
    CHECK(slice.GetType() == LATTICE_SAMPLER::SLICE_SCAN);

    SECTION("Slice scan matches the box scan on spheres") {
        for (double r : {0.5, 1., 1.5, 2., 3.7, 5., 7.25}) {
            Sphere sphere(r);
            auto a = hostUniqueLattice(box.Sample(sphere));
            auto b = hostUniqueLattice(slice.Sample(sphere));
            CHECK(a == b);
        }
    }

    SECTION("Slice scan matches the box scan on rods") {
        const std::vector<std::pair<double, double>> dims = {{1., 4.}, {1.5, 7.}, {2., 10.}, {0.7, 3.1}};
        for (const auto& d : dims) {
            Rod rod(d.first, d.second, eulerAngles_t{0, 0, 0});
            auto a = hostUniqueLattice(box.Sample(rod));
            auto b = hostUniqueLattice(slice.Sample(rod));
            CHECK(a == b);
        }
        Rod rod(2., 9., eulerAngles_t{15, 60, 200});
        CHECK(rod.Discretize(box) == rod.Discretize(slice));
    }
}

TEST_CASE("Neighbor grid", "[Samplers]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);

    SECTION("Queries see the surrounding cells only") {
        NeighborGrid grid(2.);
        grid.Insert(real3_t(0.5, 0.5, 0.5), 0);
        grid.Insert(real3_t(-1.5, 0.5, 0.5), 1);
        grid.Insert(real3_t(3.5, 0.5, 0.5), 2);
        grid.Insert(real3_t(9., 9., 9.), 3);
        CHECK(grid.GetNumCells() == 4);

        auto n = grid.GetNeighbors(real3_t(0.1, 0.1, 0.1));
        CHECK(n == std::vector<size_t>{0, 1, 2});
        CHECK(grid.GetNeighbors(real3_t(9.5, 9.5, 9.5)) == std::vector<size_t>{3});
        CHECK(grid.GetNeighbors(real3_t(-20, 0, 0)).empty());

        grid.Clear();
        CHECK(grid.GetNumCells() == 0);
        CHECK(grid.GetNeighbors(real3_t(0.1, 0.1, 0.1)).empty());
    }

    SECTION("Every point within one cell size is reported") {
        randomEngine_t re(5);
        NeighborGrid grid(3.);
        std::vector<real3_t> points;
        for (size_t i = 0; i < 200; i++) {
            points.push_back(SampleUniformInSphere(re, 10.));
            grid.Insert(points.back(), i);
        }
        for (int q = 0; q < 50; q++) {
            const real3_t p = SampleUniformInSphere(re, 10.);
            const auto n = grid.GetNeighbors(p);
            for (size_t i = 0; i < points.size(); i++) {
                if ((points[i] - p).norm() < 3.) {
                    CHECK(std::binary_search(n.begin(), n.end(), i));
                }
            }
        }
    }

    SECTION("Invalid cell size") {
        CHECK_THROWS_AS(NeighborGrid(0.), DDAPException);
    }
}

TEST_CASE("Random draws", "[Samplers]") {
    randomEngine_t re(11);

    SECTION("Ball samples stay inside the ball") {
        for (int i = 0; i < 1000; i++) {
            CHECK(SampleUniformInSphere(re, 4.).norm() <= 4. + 1e-12);
        }
    }

    SECTION("Box samples stay inside the box; empty axes collapse to the midpoint") {
        const real3_t lo(-1, 2, 5), hi(1, 3, 3);
        for (int i = 0; i < 200; i++) {
            const real3_t p = SampleUniformInBox(re, lo, hi);
            CHECK(isBetween(p.x(), -1., 1.));
            CHECK(isBetween(p.y(), 2., 3.));
            CHECK(p.z() == 4.);
        }
    }

    SECTION("Angles are in [0, 360)") {
        for (int i = 0; i < 200; i++) {
            const eulerAngles_t a = SampleEulerAngles(re);
            for (int j = 0; j < 3; j++) {
                CHECK(a[j] >= 0.);
                CHECK(a[j] < 360.);
            }
        }
    }
}
