/**
 * @file test_parameters.cpp
 * @brief Unit tests for the keyword parameter store
 */

#include <gtest/gtest.h>
#include "Parameters.hpp"
#include <algorithm>

using namespace GTS;

TEST(ParametersTest, ScalarsAndArrays) {
    ParameterSet ps;
    EXPECT_TRUE(ps.empty());

    ps.set("time_step", 0.5);
    ps.set("source", std::vector<double>{1.0, 2.0});

    EXPECT_FALSE(ps.empty());
    EXPECT_TRUE(ps.has("time_step"));
    EXPECT_TRUE(ps.has("source"));
    EXPECT_DOUBLE_EQ(ps.scalar("time_step"), 0.5);
    EXPECT_EQ(ps.array("source").size(), 2u);
}

TEST(ParametersTest, MissingKeyNamesIt) {
    ParameterSet ps;
    try {
        ps.scalar("biot_alpha");
        FAIL() << "Expected std::out_of_range";
    } catch (const std::out_of_range& e) {
        EXPECT_NE(std::string(e.what()).find("biot_alpha"), std::string::npos);
    }
    EXPECT_THROW(ps.array("bc_values"), std::out_of_range);
    EXPECT_THROW(ps.bc(), std::out_of_range);
    EXPECT_THROW(ps.stiffness(), std::out_of_range);
    EXPECT_THROW(ps.permeability(), std::out_of_range);
}

TEST(ParametersTest, ReservedKeys) {
    ParameterSet ps;
    ps.setStiffness(FourthOrderTensor({1.0}, {1.0}));
    ps.setPermeability(SecondOrderTensor(std::vector<double>{2.0}));

    EXPECT_TRUE(ps.has("fourth_order_tensor"));
    EXPECT_TRUE(ps.has("second_order_tensor"));
    EXPECT_FALSE(ps.has("bc"));

    auto keys = ps.keys();
    EXPECT_NE(std::find(keys.begin(), keys.end(), "second_order_tensor"), keys.end());
}

TEST(ParametersTest, StiffnessValidation) {
    EXPECT_THROW(FourthOrderTensor({1.0, 1.0}, {1.0}), std::invalid_argument);
    EXPECT_THROW(FourthOrderTensor({0.0}, {1.0}), std::invalid_argument);
    EXPECT_THROW(FourthOrderTensor({1.0}, {-1.0}), std::invalid_argument);
    EXPECT_NO_THROW(FourthOrderTensor({1.0}, {-0.5}));
}

TEST(ParametersTest, InitializeDataKeepsOtherEntries) {
    ParameterMap store;

    ParameterSet first;
    first.set("mass_weight", 1.0);
    first.set("biot_alpha", 0.8);
    initializeData(store, "flow", first);

    ParameterSet second;
    second.set("biot_alpha", 0.5);
    second.set("aperture", 2.0);
    initializeData(store, "flow", second);

    const ParameterSet& flow = store.at("flow");
    EXPECT_DOUBLE_EQ(flow.scalar("mass_weight"), 1.0);
    EXPECT_DOUBLE_EQ(flow.scalar("biot_alpha"), 0.5);
    EXPECT_DOUBLE_EQ(flow.scalar("aperture"), 2.0);
    EXPECT_EQ(store.count("mechanics"), 0u);
}

TEST(ParametersTest, InitializeDataIsIdempotent) {
    ParameterMap store;
    ParameterSet ps;
    ps.set("time_step", 1.0);
    ps.set("source", std::vector<double>{3.0});

    initializeData(store, "flow", ps);
    auto keys_once = store.at("flow").keys();
    initializeData(store, "flow", ps);

    EXPECT_EQ(store.at("flow").keys(), keys_once);
    EXPECT_DOUBLE_EQ(store.at("flow").array("source")[0], 3.0);
}
