/**
 * @file test_field_array.cpp
 * @brief Unit tests for the column-major array view
 */

#include <gtest/gtest.h>
#include "FieldArray.hpp"

using namespace GTS;

TEST(FieldArrayTest, ColumnsHoldCellVectors) {
    std::vector<double> u = {1, 2, 3, 4, 5, 6};
    ColumnMajorArray view(u, 3);

    EXPECT_EQ(view.rows(), 3);
    EXPECT_EQ(view.cols(), 2);
    EXPECT_DOUBLE_EQ(view(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(view(2, 0), 3.0);
    EXPECT_EQ(view.column(1), (std::vector<double>{4, 5, 6}));
}

TEST(FieldArrayTest, WritesThroughToStorage) {
    std::vector<double> u(6, 0.0);
    ColumnMajorArray view(u, 3);
    view(1, 1) = 7.0;
    EXPECT_DOUBLE_EQ(u[4], 7.0);
}

TEST(FieldArrayTest, RejectsIncompatibleShape) {
    std::vector<double> u(5, 0.0);
    EXPECT_THROW(ColumnMajorArray(u, 3), std::invalid_argument);
    EXPECT_THROW(ColumnMajorArray(u, 0), std::invalid_argument);
}
