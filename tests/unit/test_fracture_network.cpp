/**
 * @file test_fracture_network.cpp
 * @brief Unit tests for shear-zone fitting and export
 */

#include <gtest/gtest.h>
#include "FractureNetwork.hpp"
#include "IscData.hpp"
#include "../test_fixtures.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace GTS;

class FractureNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        box = GTS::testing::cubeBox(2.0);
        table = GTS::testing::latticeTable();
    }

    int rank;
    BoundingBox box;
    IntersectionTable table;
};

TEST_F(FractureNetworkTest, FitsZonesInRequestedOrder) {
    FractureNetwork network({"S3_1", "S1_2"}, table, box);

    ASSERT_EQ(network.size(), 2u);
    EXPECT_EQ(network.zone(0).name, "S3_1");
    EXPECT_EQ(network.zone(1).name, "S1_2");
    EXPECT_EQ(network.findZone("S1_2"), 1);
    EXPECT_EQ(network.findZone("S1_1"), -1);
    EXPECT_EQ(network.zone(1).num_points, 3);
}

TEST_F(FractureNetworkTest, HorizontalZoneCoversBoxSection) {
    FractureNetwork network({"S1_2"}, table, box);
    const ShearZone& sz = network.zone(0);

    EXPECT_NEAR(std::abs(sz.plane.normal[2]), 1.0, 1e-10);
    EXPECT_NEAR(sz.area(), 4.0, 1e-9);
    EXPECT_NEAR(sz.dip(), 0.0, 1e-6);
    EXPECT_TRUE(sz.contains({0.3, 1.7, 1.0}, 1e-9));
    EXPECT_FALSE(sz.contains({0.3, 1.7, 1.2}, 1e-9));
}

TEST_F(FractureNetworkTest, VerticalZoneDipsNinetyDegrees) {
    FractureNetwork network({"S3_1"}, table, box);
    EXPECT_NEAR(network.zone(0).dip(), 90.0, 1e-6);
}

TEST_F(FractureNetworkTest, UnknownZoneThrows) {
    EXPECT_THROW(FractureNetwork({"S2_1"}, table, box), std::domain_error);
}

TEST_F(FractureNetworkTest, TooFewPointsThrows) {
    IntersectionTable sparse;
    sparse.addRecord({"INJ1", "S1_1", {0.0, 0.0, 1.0}});
    sparse.addRecord({"INJ2", "S1_1", {1.0, 0.0, 1.0}});
    EXPECT_THROW(FractureNetwork({"S1_1"}, sparse, box), std::domain_error);
}

TEST_F(FractureNetworkTest, ZoneOutsideBoxThrows) {
    IntersectionTable far;
    far.addRecord({"INJ1", "S1_1", {0.0, 0.0, 10.0}});
    far.addRecord({"INJ2", "S1_1", {1.0, 0.0, 10.0}});
    far.addRecord({"PRP1", "S1_1", {0.0, 1.0, 10.0}});
    EXPECT_THROW(FractureNetwork({"S1_1"}, far, box), std::domain_error);
}

TEST_F(FractureNetworkTest, WritesGmshGeometry) {
    const std::string folder = GTS::testing::scratchFolder("network_geo_" + std::to_string(rank));
    FractureNetwork network({"S1_2", "S3_1"}, table, box);

    MeshArgs args;
    args.mesh_size_frac = 0.5;
    args.mesh_size_min = 0.1;
    args.mesh_size_bound = 1.0;
    network.exportToGmsh(folder + "/net.geo", args);

    std::ifstream in(folder + "/net.geo");
    ASSERT_TRUE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string geo = ss.str();

    EXPECT_NE(geo.find("SetFactory(\"OpenCASCADE\")"), std::string::npos);
    EXPECT_NE(geo.find("Box(1)"), std::string::npos);
    EXPECT_NE(geo.find("BooleanFragments"), std::string::npos);

    network.writeVTK(folder + "/shearzones.vtk");
    EXPECT_TRUE(std::filesystem::exists(folder + "/shearzones.vtk"));
    std::filesystem::remove_all(folder);
}
