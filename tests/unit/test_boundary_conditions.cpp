/**
 * @file test_boundary_conditions.cpp
 * @brief Unit tests for face-wise boundary conditions and domain sides
 */

#include <gtest/gtest.h>
#include "BoundaryConditions.hpp"
#include "GridBucket.hpp"
#include "MeshGenerator.hpp"
#include "../test_fixtures.hpp"

using namespace GTS;

class BoundaryConditionTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        box = GTS::testing::cubeBox(2.0);
        network = FractureNetwork({{"S1_2", GTS::testing::horizontalPlane(1.0)}}, box);
        gb = buildGridBucket(*StructuredMesher::kuhnMesh(network, {2, 2, 2}), network);
    }

    int rank;
    BoundingBox box;
    FractureNetwork network;
    std::shared_ptr<GridBucket> gb;
};

// ============================================================================
// Scalar conditions
// ============================================================================

TEST_F(BoundaryConditionTest, UnlistedFacesAreNeumann) {
    const Grid& g = gb->grid(0);
    std::vector<int> faces = g.boundaryFaces();
    BoundaryCondition bc(g, {faces[0], faces[1]}, BoundaryType::DIRICHLET);

    EXPECT_EQ(bc.numFaces(), g.numFaces());
    EXPECT_TRUE(bc.isDirichlet(faces[0]));
    EXPECT_TRUE(bc.isNeumann(faces[2]));
    EXPECT_EQ(bc.dirichletFaces().size(), 2u);
}

TEST_F(BoundaryConditionTest, NeumannListInvertsDefault) {
    const Grid& g = gb->grid(0);
    BoundaryCondition bc(g, {0}, BoundaryType::NEUMANN);

    EXPECT_TRUE(bc.isNeumann(0));
    EXPECT_EQ(bc.dirichletFaces().size(), static_cast<size_t>(g.numFaces() - 1));
}

TEST_F(BoundaryConditionTest, OutOfRangeFaceThrows) {
    const Grid& g = gb->grid(0);
    EXPECT_THROW(BoundaryCondition(g, {g.numFaces()}), std::out_of_range);
    EXPECT_THROW(BoundaryConditionVectorial(g, {-1}), std::out_of_range);
}

// ============================================================================
// Vectorial conditions
// ============================================================================

TEST_F(BoundaryConditionTest, VectorialPerComponent) {
    const Grid& g = gb->grid(0);
    std::vector<int> faces = g.boundaryFaces();
    BoundaryConditionVectorial bc(g, faces, BoundaryType::DIRICHLET);

    EXPECT_EQ(bc.dirichletFaces().size(), faces.size());

    // Roller: free tangential components
    bc.setType(faces[0], 0, BoundaryType::NEUMANN);
    EXPECT_TRUE(bc.isNeumann(faces[0], 0));
    EXPECT_TRUE(bc.isDirichlet(faces[0], 2));
    EXPECT_EQ(bc.dirichletFaces().size(), faces.size() - 1);
}

// ============================================================================
// Domain sides
// ============================================================================

TEST_F(BoundaryConditionTest, SidesOfStructuredCube) {
    const Grid& g = gb->grid(0);
    BoundarySides sides = domainBoundarySides(g, box, 1e-6);

    // Each side of the 2x2x2 lattice has 4 squares split into 2 triangles
    EXPECT_EQ(sides.all_faces.size(), 48u);
    EXPECT_EQ(BoundarySides::indices(sides.top).size(), 8u);
    EXPECT_EQ(BoundarySides::indices(sides.bottom).size(), 8u);
    EXPECT_EQ(BoundarySides::indices(sides.east).size(), 8u);
    EXPECT_EQ(BoundarySides::indices(sides.west).size(), 8u);
    EXPECT_EQ(BoundarySides::indices(sides.north).size(), 8u);
    EXPECT_EQ(BoundarySides::indices(sides.south).size(), 8u);

    for (int f : BoundarySides::indices(sides.top)) {
        EXPECT_NEAR(g.faceCenter(f)[2], 2.0, 1e-12);
    }
}

TEST_F(BoundaryConditionTest, FractureGridBoundaryTouchesSides) {
    const Grid& frac = gb->grid(1);
    BoundarySides sides = domainBoundarySides(frac, box, 1e-6);

    // The horizontal fracture meets the four vertical sides only
    EXPECT_TRUE(BoundarySides::indices(sides.top).empty());
    EXPECT_TRUE(BoundarySides::indices(sides.bottom).empty());
    EXPECT_EQ(BoundarySides::indices(sides.east).size(), 2u);
    EXPECT_EQ(sides.all_faces.size(), 8u);
}
