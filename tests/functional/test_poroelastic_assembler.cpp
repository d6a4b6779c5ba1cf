/**
 * @file test_poroelastic_assembler.cpp
 * @brief Functional tests for discretization, assembly and the linear solve
 */

#include <gtest/gtest.h>
#include "ContactMechanicsBiot.hpp"
#include "GridBucket.hpp"
#include "IscBiotModel.hpp"
#include "MeshGenerator.hpp"
#include "PoroelasticAssembler.hpp"
#include "SimulationContext.hpp"
#include "../test_fixtures.hpp"
#include <cmath>

using namespace GTS;

namespace {

// Default hooks on the lattice: homogeneous Dirichlet data and no sources
class ClosedBoxModel : public ContactMechanicsBiot {
public:
    ClosedBoxModel(SimulationContext& ctx, const SimulationConfig& config)
        : ContactMechanicsBiot(ctx, config) {}

    void createGrid(bool overwrite = false) override {
        if (gb_ && !overwrite) return;
        FractureNetwork network({{"S1_2", GTS::testing::horizontalPlane(1.0)}},
                                GTS::testing::cubeBox(2.0));
        gb_ = buildGridBucket(*StructuredMesher::kuhnMesh(network, {2, 2, 2}), network);
        nd_ = gb_->dimMax();
    }
};

// Closed box loaded by a downward unit body force
class LoadedBoxModel : public ClosedBoxModel {
public:
    using ClosedBoxModel::ClosedBoxModel;

    std::vector<double> sourceMechanics(const Grid& g) const override {
        std::vector<double> f(3 * g.numCells(), 0.0);
        for (int c = 0; c < g.numCells(); ++c) f[3 * c + 2] = -1.0;
        return f;
    }
};

} // namespace

class PoroelasticAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        folder = GTS::testing::scratchFolder("assembler");
        config = GTS::testing::latticeConfig(folder);
        ctx = std::make_unique<SimulationContext>(PETSC_COMM_SELF, config.output.viz_folder);
    }

    int rank = 0;
    std::string folder;
    SimulationConfig config;
    std::unique_ptr<SimulationContext> ctx;
};

// ============================================================================
// Degrees of freedom
// ============================================================================

TEST_F(PoroelasticAssemblerTest, DofLayout) {
    IscBiotModel model(*ctx, config);
    model.prepareSimulation();

    const GridBucket& gb = model.gridBucket();
    PoroelasticAssembler& assembler = model.assembler();
    ASSERT_TRUE(assembler.isDiscretized());

    // 48 tetrahedra with u and p, 8 triangles with p
    EXPECT_EQ(assembler.numDofs(), 4 * 48 + 8);

    const int g3 = gb.gridsOfDimension(3).front();
    const int g2 = gb.findByName("S1_2");
    EXPECT_EQ(assembler.displacementDof(0, 0) + 1, assembler.displacementDof(0, 1));
    EXPECT_EQ(assembler.displacementDof(1, 0), assembler.displacementDof(0, 0) + 3);

    // Displacements of a grid come before its pressures
    EXPECT_GT(assembler.pressureDof(g3, 0), assembler.displacementDof(47, 2));
    EXPECT_EQ(assembler.pressureDof(g3, 47) - assembler.pressureDof(g3, 0), 47);

    std::vector<int> seen(assembler.numDofs(), 0);
    for (int c = 0; c < 48; ++c) {
        for (int d = 0; d < 3; ++d) ++seen[assembler.displacementDof(c, d)];
        ++seen[assembler.pressureDof(g3, c)];
    }
    for (int c = 0; c < 8; ++c) ++seen[assembler.pressureDof(g2, c)];
    for (int count : seen) EXPECT_EQ(count, 1);
}

TEST_F(PoroelasticAssemblerTest, MechanicsOnlyDofLayout) {
    IscBiotModel model(*ctx, config);
    model.prepareSimulation();
    EXPECT_EQ(model.assembler().numDofs(), 4 * 48 + 8);

    model.setMechanicsOnly(true);
    EXPECT_TRUE(model.mechanicsOnly());
    EXPECT_FALSE(model.isPrepared());
    EXPECT_FALSE(model.assembler().isDiscretized());

    model.prepareSimulation();
    PoroelasticAssembler& assembler = model.assembler();
    EXPECT_EQ(assembler.numDofs(), 3 * 48);
    EXPECT_EQ(assembler.displacementDof(47, 2), 3 * 48 - 1);

    const GridBucket& gb = model.gridBucket();
    EXPECT_THROW(assembler.pressureDof(gb.gridsOfDimension(3).front(), 0), std::logic_error);
    EXPECT_THROW(assembler.pressureDof(gb.findByName("S1_2"), 0), std::logic_error);
}

TEST_F(PoroelasticAssemblerTest, MechanicsOnlyIgnoresFlowParameters) {
    ClosedBoxModel model(*ctx, config);
    model.createGrid();
    model.initialCondition();
    model.setMechanicsParameters();

    PoroelasticAssembler assembler;
    EXPECT_THROW(assembler.discretize(model.gridBucket()), std::out_of_range);

    assembler.setMechanicsOnly(true);
    ASSERT_NO_THROW(assembler.discretize(model.gridBucket()));
    ASSERT_NO_THROW(assembler.assemble(model.gridBucket()));
    EXPECT_EQ(assembler.numDofs(), 3 * 48);
}

TEST_F(PoroelasticAssemblerTest, BodyForceDisplacesClosedBox) {
    LoadedBoxModel model(*ctx, config);
    model.setMechanicsOnly(true);
    model.prepareSimulation();

    std::vector<double> x = model.assembleAndSolveLinearSystem(1e-12);
    ASSERT_EQ(x.size(), 3u * 48u);
    EXPECT_LT(model.assembler().residualNorm(x), 1e-8);

    // f . u = u^T K u > 0 for the symmetric positive definite stiffness
    double work = 0.0;
    for (int c = 0; c < 48; ++c) work -= x[3 * c + 2];
    EXPECT_GT(work, 0.0);

    // Pressures are left untouched
    GridBucket& gb = model.gridBucket();
    model.afterNewtonConvergence(x, 0.0, 0);
    const int g3 = gb.gridsOfDimension(3).front();
    EXPECT_EQ(gb.data(g3).state.at(keys::DISPLACEMENT), x);
    for (int i = 0; i < gb.numGrids(); ++i) {
        for (double p : gb.data(i).state.at(keys::PRESSURE)) EXPECT_EQ(p, 0.0);
    }
}

TEST_F(PoroelasticAssemblerTest, OrderOfCalls) {
    PoroelasticAssembler assembler;
    EXPECT_FALSE(assembler.isDiscretized());

    IscBiotModel model(*ctx, config);
    EXPECT_THROW(assembler.assemble(model.gridBucket()), std::logic_error);
    EXPECT_THROW(assembler.solve(1e-10), std::logic_error);
    EXPECT_THROW(model.assembleAndSolveLinearSystem(1e-10), std::logic_error);
}

TEST_F(PoroelasticAssemblerTest, MissingParametersThrow) {
    IscBiotModel model(*ctx, config);
    PoroelasticAssembler assembler;
    EXPECT_THROW(assembler.discretize(model.gridBucket()), std::out_of_range);
}

// ============================================================================
// Solve
// ============================================================================

TEST_F(PoroelasticAssemblerTest, SolutionSatisfiesSystem) {
    IscBiotModel model(*ctx, config);
    model.prepareSimulation();

    std::vector<double> x = model.assembleAndSolveLinearSystem(1e-12);
    PoroelasticAssembler& assembler = model.assembler();
    ASSERT_EQ(static_cast<int>(x.size()), assembler.numDofs());

    double norm = 0.0;
    for (double v : x) {
        ASSERT_TRUE(std::isfinite(v));
        norm += v * v;
    }
    EXPECT_GT(norm, 0.0);
    EXPECT_LT(assembler.residualNorm(x), 1e-8);

    // No correction left at the solution
    std::vector<double> dx = assembler.solveIncrement(x, 1e-12);
    for (double v : dx) EXPECT_NEAR(v, 0.0, 1e-8);

    EXPECT_THROW(assembler.solveIncrement(std::vector<double>(3, 0.0), 1e-12),
                 std::invalid_argument);
    EXPECT_THROW(assembler.residualNorm(std::vector<double>(3, 0.0)), std::invalid_argument);
}

TEST_F(PoroelasticAssemblerTest, DistributeAndCollect) {
    IscBiotModel model(*ctx, config);
    model.prepareSimulation();

    std::vector<double> x = model.assembleAndSolveLinearSystem(1e-12);
    GridBucket& gb = model.gridBucket();
    PoroelasticAssembler& assembler = model.assembler();
    assembler.distribute(gb, x);

    const int g3 = gb.gridsOfDimension(3).front();
    const int g2 = gb.findByName("S1_2");
    const auto& u = gb.data(g3).state.at(keys::DISPLACEMENT);
    ASSERT_EQ(u.size(), 3u * 48u);
    EXPECT_DOUBLE_EQ(u[3 * 5 + 1], x[assembler.displacementDof(5, 1)]);

    const auto& p = gb.data(g2).state.at(keys::PRESSURE);
    ASSERT_EQ(p.size(), 8u);
    EXPECT_DOUBLE_EQ(p[3], x[assembler.pressureDof(g2, 3)]);

    EXPECT_EQ(assembler.stateVector(gb), x);
    EXPECT_THROW(assembler.distribute(gb, std::vector<double>(5, 0.0)), std::invalid_argument);
}

TEST_F(PoroelasticAssemblerTest, HomogeneousDataGiveZeroSolution) {
    ClosedBoxModel model(*ctx, config);
    model.prepareSimulation();

    std::vector<double> x = model.assembleAndSolveLinearSystem(1e-12);
    for (double v : x) EXPECT_NEAR(v, 0.0, 1e-12);
}

TEST_F(PoroelasticAssemblerTest, InjectionSourceReachesWellCell) {
    IscBiotModel with_source(*ctx, config);
    with_source.prepareSimulation();
    std::vector<double> x = with_source.assembleAndSolveLinearSystem(1e-12);

    const GridBucket& wet = with_source.gridBucket();
    const int frac = wet.findByName("S1_2");
    const auto& tag = wet.grid(frac).tags.at(keys::WELL_CELLS);
    const auto& source = wet.data(frac).parameters.at(keys::FLOW).array("source");
    const double volume = with_source.sourceFlowRate() * with_source.timeState().time_step;
    int well = -1;
    for (size_t c = 0; c < tag.size(); ++c) {
        if (tag[c] > 0.5) {
            well = static_cast<int>(c);
            EXPECT_DOUBLE_EQ(source[c], volume);
        } else {
            EXPECT_EQ(source[c], 0.0);
        }
    }
    ASSERT_GE(well, 0);

    // Same setup without the source
    SimulationContext dry_ctx(PETSC_COMM_SELF, folder + "/dry");
    IscBiotModel dry(dry_ctx, config);
    dry.prepareSimulation();
    GridBucket& gb = dry.gridBucket();
    for (int i = 0; i < gb.numGrids(); ++i) {
        gb.data(i).parameters[keys::FLOW].set("source",
                                               std::vector<double>(gb.grid(i).numCells(), 0.0));
    }
    std::vector<double> y = dry.assembleAndSolveLinearSystem(1e-12);

    const int dof = with_source.assembler().pressureDof(frac, well);
    EXPECT_GT(std::abs(x[dof] - y[dof]), 0.0);
}
