/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "GTS.hpp"
#include <fstream>
#include <cstdio>
#include <stdexcept>

using namespace GTS;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit_" + std::to_string(rank) + ".config";

        std::ofstream config(test_config_file);
        config << "# ISC run\n";
        config << "[MESH]\n";
        config << "mesh_size_frac = 5.0\n";
        config << "mesher = structured   # built-in\n";
        config << "cells = 4, 6, 8\n";
        config << "\n[DOMAIN]\n";
        config << "xmin = 0\n";
        config << "xmax = 10\n";
        config << "\n[SHEARZONES]\n";
        config << "names = S1_1, S1_2\n";
        config << "\n[SCALES]\n";
        config << "length_scale = 100\n";
        config << "\n[DATA]\n";
        config << "data_path = default\n";
        config << "alias.default = /data/isc\n";
        config << "\n[TIME]\n";
        config << "num_steps = 5\n";
        config << "\n[SOLVER]\n";
        config << "type = amg\n";
        config << "mode = newton\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFileReturnsFalse) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("no_such_file.config"));
}

TEST_F(ConfigReaderTest, RawValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_DOUBLE_EQ(reader.getDouble("MESH", "mesh_size_frac", 0.0), 5.0);
    EXPECT_EQ(reader.getString("MESH", "mesher"), "structured");
    EXPECT_EQ(reader.getIntArray("MESH", "cells"), (std::vector<int>{4, 6, 8}));
    EXPECT_EQ(reader.getInt("TIME", "num_steps", 0), 5);
    EXPECT_EQ(reader.getInt("TIME", "missing", 7), 7);
    EXPECT_TRUE(reader.hasSection("DATA"));
    EXPECT_FALSE(reader.hasKey("DATA", "nothing"));
}

TEST_F(ConfigReaderTest, ParseSimulationConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    SimulationConfig config;
    reader.parseSimulationConfig(config);

    EXPECT_EQ(config.mesh_args.mesher, MesherType::STRUCTURED);
    EXPECT_DOUBLE_EQ(config.mesh_args.mesh_size_min, 0.5);
    EXPECT_DOUBLE_EQ(config.mesh_args.mesh_size_bound, 30.0);
    EXPECT_EQ(config.mesh_args.cells[2], 8);
    EXPECT_DOUBLE_EQ(config.box.xmax, 10.0);
    EXPECT_DOUBLE_EQ(config.box.ymax, 150.0);
    EXPECT_EQ(config.shearzone_names, (std::vector<std::string>{"S1_1", "S1_2"}));
    EXPECT_DOUBLE_EQ(config.scales.length_scale, 100.0);
    EXPECT_DOUBLE_EQ(config.scales.scalar_scale, 1.0);
    EXPECT_EQ(config.data_aliases.at("default"), "/data/isc");
    EXPECT_EQ(config.time.num_steps, 5);
    EXPECT_EQ(config.solver.type, SolverType::AMG);
    EXPECT_EQ(config.solver.mode, DriverMode::NEWTON);
    EXPECT_EQ(config.injection.shearzone, "S1_2");
    EXPECT_EQ(config.injection.borehole, "INJ1");
}

TEST_F(ConfigReaderTest, UnparsableValueThrows) {
    std::ofstream config(test_config_file, std::ios::app);
    config << "\n[NEWTON]\nmax_iterations = ten\n";
    config.close();

    ConfigReader reader;
    reader.loadFile(test_config_file);
    EXPECT_THROW(reader.getInt("NEWTON", "max_iterations", 1), std::invalid_argument);

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errors.empty());
}

TEST_F(ConfigReaderTest, UnknownEnumThrows) {
    std::ofstream config(test_config_file, std::ios::app);
    config << "\n[SOLVER]\ntype = multigrid\n";
    config.close();

    ConfigReader reader;
    reader.loadFile(test_config_file);
    SimulationConfig sim;
    EXPECT_THROW(reader.parseSimulationConfig(sim), std::invalid_argument);
}

TEST_F(ConfigReaderTest, ValidateRejectsInconsistentSettings) {
    std::ofstream config(test_config_file, std::ios::app);
    config << "\n[INJECTION]\nshearzone = S3_1\n";
    config << "\n[TIME]\nnum_steps = 0\n";
    config.close();

    ConfigReader reader;
    reader.loadFile(test_config_file);
    auto result = reader.validate();

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(ConfigReaderTest, ValidConfiguration) {
    ConfigReader reader;
    reader.loadFile(test_config_file);
    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, MergeOverridesValues) {
    const std::string override_file = "test_config_override_" + std::to_string(rank) + ".config";
    std::ofstream config(override_file);
    config << "[TIME]\nnum_steps = 9\n";
    config.close();

    ConfigReader reader;
    reader.loadFile(test_config_file);
    ASSERT_TRUE(reader.mergeFile(override_file));
    EXPECT_EQ(reader.getInt("TIME", "num_steps", 0), 9);
    EXPECT_DOUBLE_EQ(reader.getDouble("MESH", "mesh_size_frac", 0.0), 5.0);
    std::remove(override_file.c_str());
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string template_file = "test_template_" + std::to_string(rank) + ".config";
    ConfigReader::generateTemplate(template_file);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    auto result = reader.validate();
    EXPECT_TRUE(result.valid);

    SimulationConfig parsed;
    reader.parseSimulationConfig(parsed);
    SimulationConfig defaults;
    EXPECT_EQ(parsed.shearzone_names, defaults.shearzone_names);
    EXPECT_DOUBLE_EQ(parsed.box.xmin, defaults.box.xmin);
    EXPECT_EQ(parsed.time.num_steps, defaults.time.num_steps);
    EXPECT_EQ(parsed.data_aliases.at("default"), "data");
    std::remove(template_file.c_str());
}

TEST_F(ConfigReaderTest, TemplateToUnwritablePathThrows) {
    const std::string bad = "no_such_dir_" + std::to_string(rank) + "/template.config";
    EXPECT_THROW(ConfigReader::generateTemplate(bad), std::runtime_error);
}

TEST(ConfigEnumTest, StringConversions) {
    EXPECT_EQ(mesherTypeFromString(toString(MesherType::GMSH)), MesherType::GMSH);
    EXPECT_EQ(solverTypeFromString(toString(SolverType::ITERATIVE)), SolverType::ITERATIVE);
    EXPECT_EQ(driverModeFromString(toString(DriverMode::SINGLE_SHOT)), DriverMode::SINGLE_SHOT);
    EXPECT_THROW(driverModeFromString("implicit"), std::invalid_argument);
}
