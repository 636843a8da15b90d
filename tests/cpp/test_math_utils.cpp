/**
 * @file test_math_utils.cpp
 * @brief Unit tests for math_utils functions
 */

#include <gtest/gtest.h>
#include <cmath>
#include "core/math_utils.hpp"

namespace {

// Test column statistics
TEST(MathUtilsTest, ColumnMeans) {
    Eigen::MatrixXd data(3, 2);
    data << 1.0, 2.0,
            3.0, 4.0,
            5.0, 6.0;

    Eigen::RowVectorXd means = pls::column_means(data);
    ASSERT_EQ(means.size(), 2);
    EXPECT_DOUBLE_EQ(means(0), 3.0);
    EXPECT_DOUBLE_EQ(means(1), 4.0);
}

TEST(MathUtilsTest, ColumnMeansNoRowsThrows) {
    Eigen::MatrixXd data(0, 3);
    EXPECT_THROW(pls::column_means(data), std::invalid_argument);
}

TEST(MathUtilsTest, ColumnStdPopulation) {
    Eigen::MatrixXd data(3, 2);
    data << 1.0, 2.0,
            3.0, 2.0,
            5.0, 2.0;

    // Column 0: (4 + 0 + 4) / 3; column 1 is constant
    Eigen::RowVectorXd stds = pls::column_std(data);
    EXPECT_NEAR(stds(0), std::sqrt(8.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(stds(1), 0.0);
}

TEST(MathUtilsTest, ColumnStdSample) {
    Eigen::MatrixXd data(3, 1);
    data << 1.0, 3.0, 5.0;

    // (4 + 0 + 4) / 2 = 4
    EXPECT_NEAR(pls::column_std(data, 1)(0), 2.0, 1e-12);
}

TEST(MathUtilsTest, ColumnStdHandComputed) {
    Eigen::MatrixXd data(4, 1);
    data << 0.5, -1.5, 3.0, 2.0;

    // mean = 1.0; squared deviations 0.25 + 6.25 + 4 + 1 = 11.5
    EXPECT_NEAR(pls::column_std(data)(0), std::sqrt(11.5 / 4.0), 1e-12);
    EXPECT_NEAR(pls::column_std(data, 1)(0), std::sqrt(11.5 / 3.0), 1e-12);
}

TEST(MathUtilsTest, ColumnStdNegativeDdof) {
    Eigen::MatrixXd data(3, 1);
    data << 1.0, 3.0, 5.0;

    // (4 + 0 + 4) / (3 + 1) = 2
    EXPECT_NEAR(pls::column_std(data, -1)(0), std::sqrt(2.0), 1e-12);
}

TEST(MathUtilsTest, ColumnStdNotEnoughRowsThrows) {
    Eigen::MatrixXd empty(0, 2);
    EXPECT_THROW(pls::column_std(empty), std::invalid_argument);

    Eigen::MatrixXd single(1, 2);
    single << 1.0, 2.0;
    EXPECT_THROW(pls::column_std(single, 1), std::invalid_argument);
}

// Test norms
TEST(MathUtilsTest, ColumnNorms) {
    Eigen::MatrixXd data(2, 2);
    data << 3.0, 0.0,
            4.0, 0.0;

    Eigen::RowVectorXd norms = pls::column_norms(data);
    EXPECT_DOUBLE_EQ(norms(0), 5.0);
    EXPECT_DOUBLE_EQ(norms(1), 0.0);
}

TEST(MathUtilsTest, RowNorms) {
    Eigen::MatrixXd data(2, 2);
    data << 3.0, 4.0,
            0.0, 0.0;

    Eigen::VectorXd norms = pls::row_norms(data);
    EXPECT_DOUBLE_EQ(norms(0), 5.0);
    EXPECT_DOUBLE_EQ(norms(1), 0.0);
}

} // namespace
