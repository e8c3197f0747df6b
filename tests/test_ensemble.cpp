//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include "catch2/catch.hpp"

#include <DDAP/API.h>
#include <DDAP/HostSideHelpers.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

using namespace ddap;

namespace {

ParticleRecord sphereRecord(double radius, std::array<double, 3> center, const std::string& material,
                            materialIdx_t idx) {
    ParticleRecord row;
    row.shape = "sphere";
    row.radius = radius;
    row.volume = FOUR_OVER_THREE * PI * radius * radius * radius;
    row.center = center;
    row.material = material;
    row.material_idx = idx;
    return row;
}

ParticleRecord rodRecord(double radius, double length, std::array<double, 3> center, eulerAngles_t rotation) {
    ParticleRecord row;
    row.shape = "rod";
    row.radius = radius;
    row.length = length;
    row.center = center;
    row.rotation = rotation;
    row.material = "SiO2";
    row.material_idx = 2;
    return row;
}

Ensemble generateMixed(double dipoleSize) {
    EnsembleGenerator gen;
    gen.SetPlacementStrategy("v2e");
    gen.SetCloudRadius(8.);
    gen.SetDipoleSize(dipoleSize);
    gen.SetRandomSeed(2021);
    gen.LoadParticleFamily("sphere", {1.5}, 0.02, "Au", 1);
    gen.LoadParticleFamily("rod", {1., 5.}, 0.03, "SiO2", 2);
    return gen.Generate();
}

}  // namespace

TEST_CASE("Ensemble construction", "[Ensemble]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    CHECK_THROWS_AS(Ensemble(0., 1.), DDAPException);
    CHECK_THROWS_AS(Ensemble(5., -1.), DDAPException);

    Ensemble empty(5., 2., 0.3, PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE);
    CHECK(empty.GetNumBodies() == 0);
    CHECK(empty.GetPolydispersity() == 0.3);
    CHECK(empty.GetTotalVolume() == 0.);
    CHECK(empty.GetEffectiveRadius() == 0.);
    CHECK(empty.Discretize(4).empty());
    CHECK(empty.DiscretizeCloud().empty());
    CHECK(empty.EvaluateDistribution().empty());
    CHECK(empty.EvaluateCenterDistribution().GetTotalCount() == 0);
}

TEST_CASE("Copied bodies are independent of the ensemble", "[Ensemble]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    std::vector<ParticleRecord> rows = {sphereRecord(1., {2., 0., 0.}, "Au", 1),
                                        rodRecord(1., 4., {0., 3., 0.}, {0., 0., 0.})};
    const Ensemble ensemble = Ensemble::FromRecords(rows, 10., 1.);
    auto copies = ensemble.CopyBodies();
    REQUIRE(copies.size() == 2);
    CHECK(copies[0]->GetType() == SHAPE_TYPE::SPHERE);
    CHECK(copies[1]->GetType() == SHAPE_TYPE::ROD);
    CHECK(copies[0]->GetMaterial() == "Au");
    CHECK(copies[1]->GetMaterial() == "SiO2");
    CHECK(copies[0]->GetPosition().isApprox(ensemble.GetBodies()[0]->GetPosition()));

    for (auto& body : copies) {
        body->Move(real3_t(5, 5, 5));
    }
    CHECK(ensemble.GetBodies()[0]->GetPosition().isApprox(real3_t(2, 0, 0)));
    CHECK(ensemble.GetBodies()[1]->GetPosition().isApprox(real3_t(0, 3, 0)));
    CHECK(copies[0]->GetPosition().isApprox(real3_t(7, 5, 5)));
}

TEST_CASE("Rehydration from records", "[Ensemble]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    const double ds = 2.;

    SECTION("Physical units are divided by the dipole size") {
        std::vector<ParticleRecord> rows = {sphereRecord(2., {4., 0., 0.}, "Au", 1),
                                            sphereRecord(2., {-4., 0., 0.}, "Au", 1),
                                            rodRecord(2., 8., {0., 6., 0.}, {0., 0., 0.})};
        const Ensemble ensemble = Ensemble::FromRecords(rows, 20., ds);
        CHECK(ensemble.GetCloudRadius() == 10.);
        CHECK(ensemble.GetDipoleSize() == ds);
        REQUIRE(ensemble.GetNumBodies() == 3);
        CHECK(ensemble.GetNumSpheres() == 2);
        CHECK(ensemble.GetNumRods() == 1);
        CHECK(ensemble.GetPlacementReport().num_kept == 3);

        const auto& bodies = ensemble.GetBodies();
        CHECK(bodies[0]->GetRadius() == 1.);
        CHECK(bodies[0]->GetPosition().isApprox(real3_t(2, 0, 0)));
        CHECK(bodies[2]->GetRadius() == 1.);
        CHECK(*bodies[2]->GetLength() == 4.);
        CHECK(bodies[2]->GetCenterSegment().p1.isApprox(real3_t(0, 3, 1)));
        CHECK(bodies[2]->GetMaterial() == "SiO2");
        CHECK(bodies[2]->GetMaterialIndex() == 2);

        // Effective radius of two unit spheres plus a 1x4 rod
        const double volume = 2. * FOUR_OVER_THREE * PI + (FOUR_OVER_THREE * PI + 2. * PI);
        CHECK(ensemble.GetTotalVolume() == Approx(volume));
        CHECK(ensemble.GetEffectiveRadius() == Approx(std::cbrt(3. * volume / (4. * PI))));
        CHECK(ensemble.GetEffectiveRadiusPhysical() == Approx(ds * ensemble.GetEffectiveRadius()));
        CHECK(ensemble.GetVolumeFraction() == Approx(volume / (FOUR_OVER_THREE * PI * 1000.)));

        const auto dist = ensemble.EvaluateDistribution();
        CHECK(dist.count(DIST_SPHERE_SPHERE) == 1);
        CHECK(dist.count(DIST_SPHERE_ROD) == 1);
        CHECK(dist.count(DIST_SPHERE_ROD_ANGLE) == 1);
        CHECK(dist.count(DIST_ROD_ROD) == 0);
        CHECK(dist.at(DIST_SPHERE_SPHERE).GetTotalCount() == 1);
        CHECK(dist.at(DIST_SPHERE_ROD).GetTotalCount() == 2);
    }

    SECTION("Sphere subset keeps the spheres in order") {
        std::vector<ParticleRecord> rows = {sphereRecord(2., {4., 0., 0.}, "Au", 1),
                                            rodRecord(2., 8., {0., 6., 0.}, {0., 0., 0.}),
                                            sphereRecord(4., {-8., 0., 0.}, "Ag", 3)};
        const Ensemble ensemble = Ensemble::FromRecords(rows, 20., ds);
        const Ensemble spheres = ensemble.GetSphereSubset();
        REQUIRE(spheres.GetNumBodies() == 2);
        CHECK(spheres.GetNumRods() == 0);
        CHECK(spheres.GetBodies()[0]->GetMaterial() == "Au");
        CHECK(spheres.GetBodies()[1]->GetMaterial() == "Ag");
        CHECK(spheres.GetBodies()[1]->GetRadius() == 2.);
        CHECK(spheres.GetCloudRadius() == ensemble.GetCloudRadius());
        CHECK(spheres.GetPlacementReport().num_kept == 2);
    }

    SECTION("Invalid rows") {
        ParticleRecord rod = rodRecord(2., 8., {0., 0., 0.}, {0., 0., 0.});
        rod.rotation.reset();
        CHECK_THROWS_AS(Ensemble::FromRecords({rod}, 20., ds), DDAPException);

        rod = rodRecord(2., 8., {0., 0., 0.}, {0., 0., 0.});
        rod.length.reset();
        CHECK_THROWS_AS(Ensemble::FromRecords({rod}, 20., ds), DDAPException);

        ParticleRecord sphere = sphereRecord(2., {0., 0., 0.}, "Au", 0);
        CHECK_THROWS_AS(Ensemble::FromRecords({sphere}, 20., ds), DDAPException);

        sphere = sphereRecord(2., {0., 0., 0.}, "Au", 1);
        sphere.shape = "cube";
        CHECK_THROWS_AS(Ensemble::FromRecords({sphere}, 20., ds), DDAPException);

        sphere.shape = "sphere";
        CHECK_THROWS_AS(Ensemble::FromRecords({sphere}, 20., 0.), DDAPException);
    }
}

TEST_CASE("Export and rehydrate a generated ensemble", "[Ensemble]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    const double ds = 2.5;
    const Ensemble ensemble = generateMixed(ds);
    REQUIRE(ensemble.GetNumBodies() > 0);

    const std::vector<ParticleRecord> rows = ensemble.ExportRecords();
    REQUIRE(rows.size() == ensemble.GetNumBodies());
    for (size_t i = 0; i < rows.size(); i++) {
        const auto& body = ensemble.GetBodies()[i];
        CHECK(rows[i].shape == body->GetTypeName());
        CHECK(rows[i].radius == Approx(body->GetRadius() * ds));
        CHECK(rows[i].volume == Approx(body->GetVolume() * ds * ds * ds));
        CHECK(rows[i].center[0] == Approx(body->GetCenterPoint().x() * ds));
        if (body->GetType() == SHAPE_TYPE::ROD) {
            REQUIRE(rows[i].length.has_value());
            CHECK(*rows[i].length == Approx(5. * ds));
            CHECK(rows[i].rotation.has_value());
        } else {
            CHECK_FALSE(rows[i].length.has_value());
            CHECK_FALSE(rows[i].rotation.has_value());
        }
    }

    const Ensemble back =
        Ensemble::FromRecords(rows, ensemble.GetCloudRadius() * ds, ds, ensemble.GetPlacementStrategy());
    REQUIRE(back.GetNumBodies() == ensemble.GetNumBodies());
    CHECK(back.GetCloudRadius() == Approx(ensemble.GetCloudRadius()));
    for (size_t i = 0; i < rows.size(); i++) {
        const auto& a = ensemble.GetBodies()[i];
        const auto& b = back.GetBodies()[i];
        CHECK(a->GetType() == b->GetType());
        CHECK((a->GetPosition() - b->GetPosition()).norm() < 1e-9);
        CHECK((a->GetCenterSegment().p1 - b->GetCenterSegment().p1).norm() < 1e-9);
        CHECK(a->GetMaterialIndex() == b->GetMaterialIndex());
    }
    CHECK(back.GetTotalVolume() == Approx(ensemble.GetTotalVolume()));
}

TEST_CASE("Ensemble discretization", "[Ensemble]") {
    Logger::GetInstance().SetVerbosity(VERBOSITY_QUIET);
    const Ensemble ensemble = generateMixed(1.);
    REQUIRE(ensemble.GetNumBodies() > 1);

    const auto serial = ensemble.Discretize(1);
    const auto threaded = ensemble.Discretize(4, SliceScanSampler());
    REQUIRE(serial.size() == ensemble.GetNumBodies());
    REQUIRE(threaded.size() == serial.size());
    size_t total = 0;
    for (size_t i = 0; i < serial.size(); i++) {
        CHECK(serial[i].body == i);
        CHECK(threaded[i].body == i);
        CHECK(serial[i].material_idx == ensemble.GetBodies()[i]->GetMaterialIndex());
        CHECK(serial[i].dipoles == threaded[i].dipoles);
        CHECK_FALSE(serial[i].dipoles.empty());
        total += serial[i].dipoles.size();
    }

    // Bodies never share a dipole at this separation
    const auto cloud = ensemble.DiscretizeCloud(3);
    CHECK(cloud.size() == total);
    CHECK(std::is_sorted(cloud.begin(), cloud.end(), LatticeLess()));

    // More workers than bodies is fine, and zero means one
    CHECK(ensemble.Discretize(1000).size() == serial.size());
    CHECK(ensemble.Discretize(0)[0].dipoles == serial[0].dipoles);
}
