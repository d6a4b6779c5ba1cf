/**
 * @file test_isc_biot_run.cpp
 * @brief End-to-end runs of the ISC Biot setup on the structured mesher
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "IscSetup.hpp"
#include "../test_fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace GTS;

namespace fs = std::filesystem;

class IscBiotRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        folder = GTS::testing::scratchFolder("isc_biot_run");
        config = GTS::testing::latticeConfig(folder, 3);
    }

    std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    int rank = 0;
    std::string folder;
    SimulationConfig config;
};

// ============================================================================
// Single run
// ============================================================================

TEST_F(IscBiotRunTest, RunBiotModel) {
    RunSummary summary = runBiotModel(config, PETSC_COMM_SELF);

    EXPECT_EQ(summary.folder, config.output.viz_folder);
    EXPECT_EQ(summary.steps, 2);
    EXPECT_NEAR(summary.end_time, 2.0, 1e-12);
    EXPECT_EQ(summary.num_cells, 48 + 8);
    EXPECT_EQ(summary.num_dofs, 4 * 48 + 8);
    EXPECT_GT(summary.max_slip_tendency, 0.0);

    const std::string viz = config.output.viz_folder;
    EXPECT_TRUE(fs::exists(viz + "/shearzones.vtk"));
    EXPECT_TRUE(fs::exists(viz + "/gmsh_frac_file.msh"));
    EXPECT_TRUE(fs::exists(viz + "/lattice.pvd"));
    EXPECT_TRUE(fs::exists(viz + "/lattice_3_2.vtu"));
}

TEST_F(IscBiotRunTest, RunMechanicsModel) {
    RunSummary summary = runMechanicsModel(config, PETSC_COMM_SELF);

    EXPECT_EQ(summary.steps, 0);
    EXPECT_DOUBLE_EQ(summary.end_time, 0.0);
    EXPECT_EQ(summary.num_cells, 48 + 8);
    EXPECT_EQ(summary.num_dofs, 3 * 48);
    EXPECT_GT(summary.max_slip_tendency, 0.0);

    const std::string viz = config.output.viz_folder;
    EXPECT_TRUE(fs::exists(viz + "/lattice_3_0.vtu"));
    EXPECT_TRUE(fs::exists(viz + "/lattice.pvd"));

    const std::string log = readFile(viz + "/results.log");
    EXPECT_NE(log.find("INFO:IscSetup:Preparing setup for mechanics simulation"),
              std::string::npos);
    EXPECT_NE(log.find("Starting stationary mechanics simulation"), std::string::npos);
    EXPECT_NE(log.find("Stationary solve converged"), std::string::npos);
    EXPECT_EQ(log.find("DEBUG:TimeStepper:Time step"), std::string::npos);
}

TEST_F(IscBiotRunTest, ResultsLog) {
    runBiotModel(config, PETSC_COMM_SELF);

    const std::string log = readFile(config.output.viz_folder + "/results.log");
    EXPECT_NE(log.find("INFO:IscSetup:Preparing setup for biot simulation"), std::string::npos);
    EXPECT_NE(log.find("Visualization folder path: " + config.output.viz_folder),
              std::string::npos);
    EXPECT_NE(log.find("Setup complete. Starting time-dependent simulation"), std::string::npos);
    EXPECT_NE(log.find("Successful simulation."), std::string::npos);
    EXPECT_NE(log.find("S1_2"), std::string::npos);
    EXPECT_NE(log.find("DEBUG:TimeStepper:Time step 2"), std::string::npos);
}

TEST_F(IscBiotRunTest, NewtonDriver) {
    config.solver.mode = DriverMode::NEWTON;
    RunSummary summary = runBiotModel(config, PETSC_COMM_SELF);
    EXPECT_EQ(summary.steps, 2);

    const std::string log = readFile(config.output.viz_folder + "/results.log");
    EXPECT_NE(log.find("Newton iteration 1"), std::string::npos);
}

TEST_F(IscBiotRunTest, MissingDataThrows) {
    config.data_path = folder + "/does_not_exist.csv";
    EXPECT_THROW(runBiotModel(config, PETSC_COMM_SELF), std::runtime_error);
}

TEST_F(IscBiotRunTest, UnknownWellThrows) {
    config.injection.borehole = "GEO4";
    EXPECT_THROW(runBiotModel(config, PETSC_COMM_SELF), std::domain_error);
}

TEST_F(IscBiotRunTest, ShippedStructuredConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(std::string(GTS_TEST_DATA_DIR) + "/../config/isc_biot_structured.config"));
    ASSERT_TRUE(reader.validate().valid);

    SimulationConfig shipped;
    reader.parseSimulationConfig(shipped);
    shipped.data_path = std::string(GTS_TEST_DATA_DIR) + "/structured_intersections.csv";
    shipped.output.viz_folder = folder + "/shipped";

    RunSummary summary = runBiotModel(shipped, PETSC_COMM_SELF);
    EXPECT_EQ(summary.steps, shipped.time.num_steps - 1);
    EXPECT_EQ(summary.num_dofs, 4 * 384 + 32);
}

// ============================================================================
// Convergence study
// ============================================================================

TEST_F(IscBiotRunTest, ConvergenceStudy) {
    std::vector<RunSummary> levels = convergenceStudy(config, 1, PETSC_COMM_SELF);
    ASSERT_EQ(levels.size(), 2u);

    EXPECT_EQ(levels[0].num_cells, 48 + 8);
    EXPECT_EQ(levels[1].num_cells, 384 + 32);
    EXPECT_EQ(levels[1].num_dofs, 4 * 384 + 32);
    for (size_t k = 0; k < levels.size(); ++k) {
        EXPECT_EQ(levels[k].steps, 2);
        const std::string level = config.output.viz_folder + "/level_" + std::to_string(k);
        EXPECT_EQ(levels[k].folder, level);
        EXPECT_TRUE(fs::exists(level + "/lattice.pvd"));
        EXPECT_TRUE(fs::exists(level + "/results.log"));
    }

    const std::string viz = config.output.viz_folder;
    EXPECT_TRUE(fs::exists(viz + "/gmsh_frac_file.msh"));
    EXPECT_TRUE(fs::exists(viz + "/gmsh_frac_file_1.msh"));

    const std::string log = readFile(viz + "/results.log");
    EXPECT_NE(log.find("Reporting on 2 grid buckets."), std::string::npos);
    EXPECT_NE(log.find("Level 1: 416 cells"), std::string::npos);
}

TEST_F(IscBiotRunTest, MechanicsConvergenceStudy) {
    std::vector<RunSummary> levels =
        convergenceStudy(config, 1, PETSC_COMM_SELF, ModelKind::MECHANICS);
    ASSERT_EQ(levels.size(), 2u);

    EXPECT_EQ(levels[0].num_dofs, 3 * 48);
    EXPECT_EQ(levels[1].num_dofs, 3 * 384);
    for (size_t k = 0; k < levels.size(); ++k) {
        EXPECT_EQ(levels[k].steps, 0);
        const std::string level = config.output.viz_folder + "/level_" + std::to_string(k);
        EXPECT_TRUE(fs::exists(level + "/lattice_3_0.vtu"));
        EXPECT_TRUE(fs::exists(level + "/lattice.pvd"));
    }

    const std::string log = readFile(config.output.viz_folder + "/results.log");
    EXPECT_NE(log.find("Preparing setup for mechanics convergence study"), std::string::npos);
    EXPECT_NE(log.find("Level 1: 416 cells, 1152 dofs, 0 steps"), std::string::npos);
}

TEST_F(IscBiotRunTest, NegativeRefinementThrows) {
    EXPECT_THROW(convergenceStudy(config, -1, PETSC_COMM_SELF), std::invalid_argument);
}
