//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <memory>
#include <vector>
#include <string>

#include <DDAP/API.h>
#include <DDAP/Defines.h>
#include <DDAP/HostSideHelpers.hpp>
#include <DDAP/utils/Samplers.hpp>

namespace py = pybind11;

namespace {

std::vector<std::shared_ptr<const ddap::Shape>> bodiesFromPython(const std::vector<std::shared_ptr<ddap::Shape>>& in) {
    return std::vector<std::shared_ptr<const ddap::Shape>>(in.begin(), in.end());
}

ddap::eulerAngles_t toEulerAngles(const std::vector<double>& rot, const std::string& func) {
    ddap::assertThreeElements(rot, func, "rotation");
    return ddap::eulerAngles_t{rot[0], rot[1], rot[2]};
}

}  // namespace

PYBIND11_MODULE(DDAP, obj) {
    // To define methods independent of a class, use obj.def() syntax to wrap them!
    obj.def(
        "Distance",
        [](const std::vector<double>& a, const std::vector<double>& b) {
            ddap::assertThreeElements(a, "Distance", "a");
            ddap::assertThreeElements(b, "Distance", "b");
            return ddap::Distance(ddap::VecToReal3(a), ddap::VecToReal3(b));
        },
        "Distance between two points.");
    obj.def("PointSegmentDistance",
            static_cast<double (*)(const ddap::real3_t&, const ddap::Segment&)>(&ddap::Distance),
            "Distance from a point to a finite segment.");
    obj.def("SegmentSegmentDistance",
            static_cast<double (*)(const ddap::Segment&, const ddap::Segment&)>(&ddap::Distance),
            "Distance between the closest points of two finite segments.");
    obj.def("AngleToSegment", &ddap::AngleToSegment,
            "Angle (degrees) between a segment and the direction from its nearer endpoint to a point.");
    obj.def("MakeHistogram", &ddap::MakeHistogram, py::arg("values"), py::arg("lo"), py::arg("hi"),
            py::arg("num_bins"), py::arg("closeLastBin") = true);
    obj.def(
        "RotateEuler",
        [](const std::vector<double>& p, const std::vector<double>& rot) {
            ddap::assertThreeElements(p, "RotateEuler", "point");
            return ddap::Real3ToVec(ddap::RotateEuler(ddap::VecToReal3(p), toEulerAngles(rot, "RotateEuler")));
        },
        "Rotate a point about x, then y, then z (degrees).");
    obj.def(
        "EvaluateDistribution",
        [](const std::vector<std::shared_ptr<ddap::Shape>>& bodies) {
            return ddap::EvaluateDistribution(bodiesFromPython(bodies));
        },
        "Pairwise angle and distance histograms of a list of shapes.");

    obj.attr("PI") = py::float_(ddap::PI);
    obj.attr("DIST_SPHERE_ROD_ANGLE") = ddap::DIST_SPHERE_ROD_ANGLE;
    obj.attr("DIST_SPHERE_ROD") = ddap::DIST_SPHERE_ROD;
    obj.attr("DIST_SPHERE_SPHERE") = ddap::DIST_SPHERE_SPHERE;
    obj.attr("DIST_ROD_ROD") = ddap::DIST_ROD_ROD;

    py::enum_<ddap::SHAPE_TYPE>(obj, "SHAPE_TYPE")
        .value("SPHERE", ddap::SHAPE_TYPE::SPHERE)
        .value("ROD", ddap::SHAPE_TYPE::ROD)
        .export_values();

    py::enum_<ddap::PLACEMENT_STRATEGY>(obj, "PLACEMENT_STRATEGY")
        .value("CELL_TO_ENSEMBLE", ddap::PLACEMENT_STRATEGY::CELL_TO_ENSEMBLE)
        .value("VOLUME_TO_ENSEMBLE", ddap::PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE)
        .export_values();

    py::enum_<ddap::LATTICE_SAMPLER>(obj, "LATTICE_SAMPLER")
        .value("BOX_SCAN", ddap::LATTICE_SAMPLER::BOX_SCAN)
        .value("SLICE_SCAN", ddap::LATTICE_SAMPLER::SLICE_SCAN)
        .export_values();

    py::class_<ddap::Segment>(obj, "Segment")
        .def(py::init<>())
        .def(py::init<const ddap::real3_t&, const ddap::real3_t&>())
        .def_readwrite("p1", &ddap::Segment::p1)
        .def_readwrite("p2", &ddap::Segment::p2)
        .def("Midpoint", &ddap::Segment::Midpoint)
        .def("Length", &ddap::Segment::Length);

    py::class_<ddap::HistogramDistribution>(obj, "HistogramDistribution")
        .def(py::init<>())
        .def_readwrite("counts", &ddap::HistogramDistribution::counts)
        .def_readwrite("bin_edges", &ddap::HistogramDistribution::bin_edges)
        .def("GetTotalCount", &ddap::HistogramDistribution::GetTotalCount);

    py::class_<ddap::LatticeSampler, std::shared_ptr<ddap::LatticeSampler>>(obj, "LatticeSampler")
        .def("GetType", &ddap::LatticeSampler::GetType);
    py::class_<ddap::BoxScanSampler, ddap::LatticeSampler, std::shared_ptr<ddap::BoxScanSampler>>(obj,
                                                                                               "BoxScanSampler")
        .def(py::init<>());
    py::class_<ddap::SliceScanSampler, ddap::LatticeSampler, std::shared_ptr<ddap::SliceScanSampler>>(
        obj, "SliceScanSampler")
        .def(py::init<>());

    py::class_<ddap::Shape, std::shared_ptr<ddap::Shape>>(obj, "Shape")
        .def("GetType", &ddap::Shape::GetType)
        .def("GetTypeName", &ddap::Shape::GetTypeName)
        .def("GetRadius", &ddap::Shape::GetRadius)
        .def("GetVolume", &ddap::Shape::GetVolume)
        .def("GetLength", &ddap::Shape::GetLength)
        .def("GetRotation", &ddap::Shape::GetRotation)
        .def(
            "Move",
            [](ddap::Shape& self, const std::vector<double>& d) {
                ddap::assertThreeElements(d, "Move", "displacement");
                self.Move(ddap::VecToReal3(d));
            },
            "Translate the body. Translations accumulate.")
        .def("GetPosition", [](const ddap::Shape& self) { return ddap::Real3ToVec(self.GetPosition()); })
        .def("GetCenterSegment", &ddap::Shape::GetCenterSegment)
        .def("PointInside",
             [](const ddap::Shape& self, const std::vector<double>& p) {
                 ddap::assertThreeElements(p, "PointInside", "point");
                 return self.PointInside(ddap::VecToReal3(p));
             })
        .def("Discretize",
             [](const ddap::Shape& self) { return ddap::LatticeVectorToVecOfVec(self.Discretize()); })
        .def("Discretize",
             [](const ddap::Shape& self, const ddap::LatticeSampler& sampler) {
                 return ddap::LatticeVectorToVecOfVec(self.Discretize(sampler));
             })
        .def("SetMaterial", &ddap::Shape::SetMaterial)
        .def("GetMaterial", &ddap::Shape::GetMaterial)
        .def("SetMaterialIndex", &ddap::Shape::SetMaterialIndex)
        .def("GetMaterialIndex", &ddap::Shape::GetMaterialIndex);

    py::class_<ddap::Sphere, ddap::Shape, std::shared_ptr<ddap::Sphere>>(obj, "Sphere").def(py::init<double>());
    py::class_<ddap::Rod, ddap::Shape, std::shared_ptr<ddap::Rod>>(obj, "Rod")
        .def(py::init([](double radius, double height, const std::vector<double>& rot) {
                 return std::make_shared<ddap::Rod>(radius, height, toEulerAngles(rot, "Rod"));
             }),
             py::arg("radius"), py::arg("height"), py::arg("rotation"))
        .def("GetHeight", &ddap::Rod::GetHeight);

    py::class_<ddap::PlacementReport>(obj, "PlacementReport")
        .def(py::init<>())
        .def_readonly("complete", &ddap::PlacementReport::complete)
        .def_readonly("exhausted_family", &ddap::PlacementReport::exhausted_family)
        .def_readonly("trials", &ddap::PlacementReport::trials)
        .def_readonly("num_placed", &ddap::PlacementReport::num_placed)
        .def_readonly("num_kept", &ddap::PlacementReport::num_kept)
        .def_readonly("elapsed_seconds", &ddap::PlacementReport::elapsed_seconds);

    py::class_<ddap::ParticleRecord>(obj, "ParticleRecord")
        .def(py::init<>())
        .def_readwrite("shape", &ddap::ParticleRecord::shape)
        .def_readwrite("radius", &ddap::ParticleRecord::radius)
        .def_readwrite("length", &ddap::ParticleRecord::length)
        .def_readwrite("volume", &ddap::ParticleRecord::volume)
        .def_readwrite("center", &ddap::ParticleRecord::center)
        .def_readwrite("rotation", &ddap::ParticleRecord::rotation)
        .def_readwrite("material", &ddap::ParticleRecord::material)
        .def_readwrite("material_idx", &ddap::ParticleRecord::material_idx);

    py::class_<ddap::TaggedLattice>(obj, "TaggedLattice")
        .def_readonly("body", &ddap::TaggedLattice::body)
        .def_readonly("material_idx", &ddap::TaggedLattice::material_idx)
        .def_property_readonly("dipoles", [](const ddap::TaggedLattice& self) {
            return ddap::LatticeVectorToVecOfVec(self.dipoles);
        });

    py::class_<ddap::Ensemble>(obj, "Ensemble")
        .def("GetCloudRadius", &ddap::Ensemble::GetCloudRadius)
        .def("GetDipoleSize", &ddap::Ensemble::GetDipoleSize)
        .def("GetPolydispersity", &ddap::Ensemble::GetPolydispersity)
        .def("GetPlacementStrategy", &ddap::Ensemble::GetPlacementStrategy)
        .def("GetPlacementReport", &ddap::Ensemble::GetPlacementReport)
        .def("GetBodies", &ddap::Ensemble::CopyBodies)
        .def("GetNumBodies", &ddap::Ensemble::GetNumBodies)
        .def("GetNumSpheres", &ddap::Ensemble::GetNumSpheres)
        .def("GetNumRods", &ddap::Ensemble::GetNumRods)
        .def(
            "Discretize",
            [](const ddap::Ensemble& self, unsigned int nThreads) { return self.Discretize(nThreads); },
            py::arg("nThreads") = 1)
        .def(
            "DiscretizeCloud",
            [](const ddap::Ensemble& self, unsigned int nThreads) {
                return ddap::LatticeVectorToVecOfVec(self.DiscretizeCloud(nThreads));
            },
            py::arg("nThreads") = 1)
        .def("EvaluateDistribution", &ddap::Ensemble::EvaluateDistribution)
        .def("EvaluateCenterDistribution", &ddap::Ensemble::EvaluateCenterDistribution)
        .def("GetTotalVolume", &ddap::Ensemble::GetTotalVolume)
        .def("GetEffectiveRadius", &ddap::Ensemble::GetEffectiveRadius)
        .def("GetEffectiveRadiusPhysical", &ddap::Ensemble::GetEffectiveRadiusPhysical)
        .def("GetVolumeFraction", &ddap::Ensemble::GetVolumeFraction)
        .def("GetSphereSubset", &ddap::Ensemble::GetSphereSubset)
        .def("ExportRecords", &ddap::Ensemble::ExportRecords)
        .def_static("FromRecords", &ddap::Ensemble::FromRecords, py::arg("rows"), py::arg("cloud_radius"),
                    py::arg("dipole_size"), py::arg("option") = ddap::PLACEMENT_STRATEGY::VOLUME_TO_ENSEMBLE,
                    py::arg("polydispersity") = 0.);

    py::class_<ddap::ParticleFamily, std::shared_ptr<ddap::ParticleFamily>>(obj, "ParticleFamily")
        .def_readwrite("shape", &ddap::ParticleFamily::shape)
        .def_readwrite("params", &ddap::ParticleFamily::params)
        .def_readwrite("volume_fraction", &ddap::ParticleFamily::volume_fraction)
        .def_readwrite("material", &ddap::ParticleFamily::material)
        .def_readwrite("material_idx", &ddap::ParticleFamily::material_idx)
        .def_readwrite("rotation", &ddap::ParticleFamily::rotation)
        .def("GetUnitVolume", &ddap::ParticleFamily::GetUnitVolume);

    py::class_<ddap::CellLayout>(obj, "CellLayout")
        .def_readonly("N1", &ddap::CellLayout::N1)
        .def_readonly("N2", &ddap::CellLayout::N2)
        .def_readonly("L", &ddap::CellLayout::L)
        .def_readonly("phi2_achieved", &ddap::CellLayout::phi2_achieved);

    py::class_<ddap::EnsembleGenerator>(obj, "EnsembleGenerator")
        .def(py::init<>())
        .def("SetVerbosity", static_cast<void (ddap::EnsembleGenerator::*)(const std::string&)>(
                                 &ddap::EnsembleGenerator::SetVerbosity))
        .def("SetVerbosity",
             static_cast<void (ddap::EnsembleGenerator::*)(ddap::verbosity_t)>(&ddap::EnsembleGenerator::SetVerbosity))
        .def("SetCloudRadius", &ddap::EnsembleGenerator::SetCloudRadius)
        .def("SetDipoleSize", &ddap::EnsembleGenerator::SetDipoleSize)
        .def("SetPolydispersity", &ddap::EnsembleGenerator::SetPolydispersity)
        .def("SetPlacementStrategy", static_cast<void (ddap::EnsembleGenerator::*)(const std::string&)>(
                                         &ddap::EnsembleGenerator::SetPlacementStrategy))
        .def("SetPlacementStrategy", static_cast<void (ddap::EnsembleGenerator::*)(ddap::PLACEMENT_STRATEGY)>(
                                         &ddap::EnsembleGenerator::SetPlacementStrategy))
        .def("SetRandomSeed", &ddap::EnsembleGenerator::SetRandomSeed)
        .def("SetMaxPlacementTrials", &ddap::EnsembleGenerator::SetMaxPlacementTrials)
        .def("LoadParticleFamily",
             static_cast<std::shared_ptr<ddap::ParticleFamily> (ddap::EnsembleGenerator::*)(
                 const std::string&, const std::vector<double>&, double, const std::string&, ddap::materialIdx_t)>(
                 &ddap::EnsembleGenerator::LoadParticleFamily),
             py::arg("shape"), py::arg("params"), py::arg("volume_fraction"), py::arg("material"),
             py::arg("material_idx"))
        .def(
            "LoadParticleFamily",
            [](ddap::EnsembleGenerator& self, const std::string& shape, const std::vector<double>& params,
               double volume_fraction, const std::string& material, ddap::materialIdx_t material_idx,
               const std::vector<double>& rot) {
                return self.LoadParticleFamily(shape, params, volume_fraction, material, material_idx,
                                               toEulerAngles(rot, "LoadParticleFamily"));
            },
            py::arg("shape"), py::arg("params"), py::arg("volume_fraction"), py::arg("material"),
            py::arg("material_idx"), py::arg("rotation"))
        .def("GetParticleFamilies", &ddap::EnsembleGenerator::GetParticleFamilies)
        .def("ClearParticleFamilies", &ddap::EnsembleGenerator::ClearParticleFamilies)
        .def("ComputeCellLayout", &ddap::EnsembleGenerator::ComputeCellLayout)
        .def("Generate", &ddap::EnsembleGenerator::Generate);

    obj.attr("VERBOSITY_QUIET") = ddap::VERBOSITY_QUIET;
    obj.attr("VERBOSITY_ERROR") = ddap::VERBOSITY_ERROR;
    obj.attr("VERBOSITY_WARNING") = ddap::VERBOSITY_WARNING;
    obj.attr("VERBOSITY_INFO") = ddap::VERBOSITY_INFO;
    obj.attr("VERBOSITY_STEP") = ddap::VERBOSITY_STEP;
    obj.attr("VERBOSITY_DEBUG") = ddap::VERBOSITY_DEBUG;
}
