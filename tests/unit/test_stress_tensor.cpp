/**
 * @file test_stress_tensor.cpp
 * @brief Unit tests for the principal-axes stress construction
 */

#include <gtest/gtest.h>
#include "StressTensor.hpp"
#include "Geometry.hpp"
#include <cmath>

using namespace GTS;

TEST(StressTensorTest, PrincipalDirectionConvention) {
    // Horizontal, pointing north
    Point3 north = principalDirection(0.0, 0.0);
    EXPECT_NEAR(north[0], 0.0, 1e-14);
    EXPECT_NEAR(north[1], 1.0, 1e-14);
    EXPECT_NEAR(north[2], 0.0, 1e-14);

    // Horizontal, pointing east
    Point3 east = principalDirection(0.0, 90.0);
    EXPECT_NEAR(east[0], 1.0, 1e-14);
    EXPECT_NEAR(east[1], 0.0, 1e-14);

    // Vertical, pointing down
    Point3 down = principalDirection(90.0, 0.0);
    EXPECT_NEAR(down[2], -1.0, 1e-14);
}

TEST(StressTensorTest, OrthonormalizeKeepsOrthogonalMatrix) {
    Tensor3 q = orthonormalizeColumns(geom::identity());
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            EXPECT_NEAR(q[i][j], i == j ? 1.0 : 0.0, 1e-14);
}

TEST(StressTensorTest, OrthonormalizeRejectsDependentColumns) {
    Tensor3 m = {{{1.0, 2.0, 0.0}, {0.0, 0.0, 1.0}, {0.0, 0.0, 0.0}}};
    EXPECT_THROW(orthonormalizeColumns(m), std::invalid_argument);
}

TEST(StressTensorTest, AxisAlignedPrincipalStress) {
    // Axes along north, east and down
    Tensor3 s = stressTensor({3.0, 2.0, 1.0}, {0.0, 0.0, 90.0}, {0.0, 90.0, 0.0});

    EXPECT_NEAR(s[1][1], -3.0, 1e-12);
    EXPECT_NEAR(s[0][0], -2.0, 1e-12);
    EXPECT_NEAR(s[2][2], -1.0, 1e-12);
    EXPECT_NEAR(s[0][1], 0.0, 1e-12);
    EXPECT_NEAR(s[1][2], 0.0, 1e-12);
}

TEST(StressTensorTest, IscTensorIsSymmetric) {
    Tensor3 s = iscStressTensor();
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            EXPECT_NEAR(s[i][j], s[j][i], 1e-6);
}

TEST(StressTensorTest, IscTensorKeepsPrincipalMagnitudes) {
    Tensor3 s = iscStressTensor();
    Point3 values = geom::symmetricEigenvalues(s);

    EXPECT_NEAR(values[0], -13.1e6, 1.0);
    EXPECT_NEAR(values[1], -9.2e6, 1.0);
    EXPECT_NEAR(values[2], -8.7e6, 1.0);

    double trace = s[0][0] + s[1][1] + s[2][2];
    EXPECT_NEAR(trace, -31.0e6, 1e-3);
}

TEST(StressTensorTest, MagnitudesBecomeCompressiveEigenvalues) {
    Tensor3 s = stressTensor({13.1e6, 9.2e6, 8.7e6}, {39.21, 47.90, 12.89},
                             {104.48, 259.05, 3.72});
    Point3 values = geom::symmetricEigenvalues(s);

    EXPECT_NEAR(values[0], -13.1e6, 1.0);
    EXPECT_NEAR(values[1], -9.2e6, 1.0);
    EXPECT_NEAR(values[2], -8.7e6, 1.0);
    EXPECT_NEAR(s[0][0] + s[1][1] + s[2][2], -31.0e6, 1e-3);
}

TEST(StressTensorTest, ConsistentPermutationOfOrthogonalAxes) {
    const Point3 magnitudes = {3.0, 2.0, 1.0};
    const Point3 dips = {0.0, 0.0, 90.0};
    const Point3 dip_directions = {30.0, 120.0, 0.0};
    Tensor3 a = stressTensor(magnitudes, dips, dip_directions);

    const int perm[3] = {2, 0, 1};
    Point3 m, d, dd;
    for (int k = 0; k < 3; ++k) {
        m[k] = magnitudes[perm[k]];
        d[k] = dips[perm[k]];
        dd[k] = dip_directions[perm[k]];
    }
    Tensor3 b = stressTensor(m, d, dd);

    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            EXPECT_NEAR(a[i][j], b[i][j], 1e-12);
}

TEST(StressTensorTest, ConsistentPermutationOfIscAxes) {
    const Point3 magnitudes = {13.1e6, 9.2e6, 8.7e6};
    const Point3 dips = {39.21, 47.90, 12.89};
    const Point3 dip_directions = {104.48, 259.05, 3.72};
    Tensor3 a = stressTensor(magnitudes, dips, dip_directions);

    // The measured axes are orthogonal to about 1e-4, so the QR factor
    // depends slightly on column order
    const int perms[2][3] = {{1, 2, 0}, {2, 1, 0}};
    for (const auto& perm : perms) {
        Point3 m, d, dd;
        for (int k = 0; k < 3; ++k) {
            m[k] = magnitudes[perm[k]];
            d[k] = dips[perm[k]];
            dd[k] = dip_directions[perm[k]];
        }
        Tensor3 b = stressTensor(m, d, dd);
        for (int i = 0; i < 3; ++i)
            for (int j = 0; j < 3; ++j)
                EXPECT_NEAR(a[i][j], b[i][j], 1e-3 * 13.1e6);
    }
}
