/**
 * @file test_well_tagger.cpp
 * @brief Unit tests for tagging the injection cell
 */

#include <gtest/gtest.h>
#include "WellTagger.hpp"
#include "GridBucket.hpp"
#include "IscData.hpp"
#include "Logger.hpp"
#include "MeshGenerator.hpp"
#include "../test_fixtures.hpp"
#include <numeric>
#include <sstream>

using namespace GTS;

class WellTaggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        table = GTS::testing::latticeTable();
        network = FractureNetwork({"S1_2", "S3_1"}, table, GTS::testing::cubeBox(2.0));
        gb = buildGridBucket(*StructuredMesher::kuhnMesh(network, {2, 2, 2}), network);
    }

    int rank;
    IntersectionTable table;
    FractureNetwork network;
    std::shared_ptr<GridBucket> gb;
};

TEST_F(WellTaggerTest, TagsClosestCellOfNamedGrid) {
    InjectionSite site;
    WellTag tag = tagWellCells(*gb, table, site);

    EXPECT_EQ(tag.grid, gb->findByName("S1_2"));
    const Grid& g = gb->grid(tag.grid);
    double d = -1.0;
    EXPECT_EQ(tag.cell, g.closestCell({0.6, 0.6, 1.0}, &d));
    EXPECT_DOUBLE_EQ(tag.distance, d);

    for (int i = 0; i < gb->numGrids(); ++i) {
        const auto& tags = gb->grid(i).tags.at(keys::WELL_CELLS);
        ASSERT_EQ(tags.size(), static_cast<size_t>(gb->grid(i).numCells()));
        const double sum = std::accumulate(tags.begin(), tags.end(), 0.0);
        EXPECT_DOUBLE_EQ(sum, i == tag.grid ? 1.0 : 0.0);
        EXPECT_EQ(gb->data(i).state.at(keys::WELL), tags);
    }
}

TEST_F(WellTaggerTest, RepeatedTaggingIsStable) {
    InjectionSite site;
    WellTag first = tagWellCells(*gb, table, site);
    auto tags = gb->grid(first.grid).tags.at(keys::WELL_CELLS);

    WellTag second = tagWellCells(*gb, table, site);
    EXPECT_EQ(second.cell, first.cell);
    EXPECT_EQ(gb->grid(first.grid).tags.at(keys::WELL_CELLS), tags);
}

TEST_F(WellTaggerTest, NoIntersectionThrows) {
    InjectionSite site;
    site.borehole = "GEO1";
    EXPECT_THROW(tagWellCells(*gb, table, site), std::domain_error);
}

TEST_F(WellTaggerTest, DuplicateIntersectionThrows) {
    table.addRecord({"INJ1", "S1_2", {1.4, 1.4, 1.0}});
    InjectionSite site;
    EXPECT_THROW(tagWellCells(*gb, table, site), std::length_error);
}

TEST_F(WellTaggerTest, UnnamedShearZoneThrows) {
    table.addRecord({"INJ1", "S1_3", {1.0, 1.0, 1.5}});
    InjectionSite site;
    site.shearzone = "S1_3";
    EXPECT_THROW(tagWellCells(*gb, table, site), std::domain_error);
}

TEST_F(WellTaggerTest, LogsPlacement) {
    const std::string folder = GTS::testing::scratchFolder("well_log_" + std::to_string(rank));
    {
        Logger logger(PETSC_COMM_SELF);
        logger.setConsoleLevel(LogLevel::ERROR);
        logger.openFile(folder + "/results.log");
        tagWellCells(*gb, table, InjectionSite(), &logger);
    }
    std::ifstream in(folder + "/results.log");
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("Grid of name: S1_2, and dimension 2"), std::string::npos);
    EXPECT_NE(ss.str().find("Closest cell found has distance"), std::string::npos);
    std::filesystem::remove_all(folder);
}
