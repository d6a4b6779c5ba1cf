#include "ContactMechanicsBiot.hpp"
#include "FieldArray.hpp"
#include "Parameters.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace GTS {

ContactMechanicsBiot::ContactMechanicsBiot(SimulationContext& ctx, const SimulationConfig& config)
    : ctx_(ctx), config_(config),
      assembler_(std::make_unique<PoroelasticAssembler>(PETSC_COMM_SELF)) {
    if (config_.scales.scalar_scale <= 0.0 || config_.scales.length_scale <= 0.0) {
        throw std::invalid_argument("Scales must be positive");
    }
    assembler_->setSolverType(config_.solver.type);
    setTimeParameters();
}

void ContactMechanicsBiot::setTimeParameters() {
    if (config_.time.num_steps < 1) {
        throw std::invalid_argument("num_steps must be at least 1");
    }
    time_.time = 0.0;
    time_.time_step = config_.time.time_step_factor * lengthScale() * lengthScale();
    time_.end_time = time_.time_step * (config_.time.num_steps - 1);
    time_.step = 0;
}

GridBucket& ContactMechanicsBiot::gridBucket() {
    if (!gb_) throw std::logic_error("Grid bucket has not been created");
    return *gb_;
}

const GridBucket& ContactMechanicsBiot::gridBucket() const {
    if (!gb_) throw std::logic_error("Grid bucket has not been created");
    return *gb_;
}

Exporter& ContactMechanicsBiot::exporter() {
    if (!viz_) throw std::logic_error("Exporter has not been set up");
    return *viz_;
}

BoundarySides ContactMechanicsBiot::domainBoundarySides(const Grid& g) const {
    const double tol = 1e-6 * std::max(1.0, config_.box.maxExtent());
    return GTS::domainBoundarySides(g, config_.box, tol);
}

// ============================================================================
// Default hooks
// ============================================================================

BoundaryConditionVectorial ContactMechanicsBiot::bcTypeMechanics(const Grid& g) const {
    std::vector<int> faces = g.boundaryFaces();
    auto tag = g.tags.find(keys::FRACTURE_FACES);
    if (tag != g.tags.end()) {
        for (int f = 0; f < g.numFaces(); ++f) {
            if (tag->second[f] > 0.5 && !g.isBoundaryFace(f)) faces.push_back(f);
        }
    }
    return BoundaryConditionVectorial(g, faces, BoundaryType::DIRICHLET);
}

std::vector<double> ContactMechanicsBiot::bcValuesMechanics(const Grid& g) const {
    return std::vector<double>(3 * g.numFaces(), 0.0);
}

std::vector<double> ContactMechanicsBiot::sourceMechanics(const Grid& g) const {
    return std::vector<double>(3 * g.numCells(), 0.0);
}

std::vector<double> ContactMechanicsBiot::lameMu(const Grid& g) const {
    return std::vector<double>(g.numCells(), config_.material.lame_mu);
}

std::vector<double> ContactMechanicsBiot::lameLambda(const Grid& g) const {
    return std::vector<double>(g.numCells(), config_.material.lame_lambda);
}

std::vector<double> ContactMechanicsBiot::frictionCoefficient(const Grid& g) const {
    return std::vector<double>(g.numCells(), config_.material.friction_coefficient);
}

BoundaryCondition ContactMechanicsBiot::bcTypeScalar(const Grid& g) const {
    return BoundaryCondition(g, g.boundaryFaces(), BoundaryType::DIRICHLET);
}

std::vector<double> ContactMechanicsBiot::bcValuesScalar(const Grid& g) const {
    return std::vector<double>(g.numFaces(), 0.0);
}

std::vector<double> ContactMechanicsBiot::sourceScalar(const Grid& g) const {
    return std::vector<double>(g.numCells(), 0.0);
}

std::vector<double> ContactMechanicsBiot::permeability(const Grid& g) const {
    const double k = config_.material.permeability * scalarScale() / (lengthScale() * lengthScale());
    return std::vector<double>(g.numCells(), k);
}

double ContactMechanicsBiot::biotAlpha(const Grid&) const {
    return config_.material.biot_alpha;
}

// ============================================================================
// Parameters and state
// ============================================================================

void ContactMechanicsBiot::setMechanicsParameters() {
    GridBucket& gb = gridBucket();
    for (int i = 0; i < gb.numGrids(); ++i) {
        const Grid& g = gb.grid(i);
        ParameterSet ps;
        if (g.dim() == nd_) {
            std::vector<double> mu = lameMu(g);
            std::vector<double> lam = lameLambda(g);
            for (double& v : mu) v /= scalarScale();
            for (double& v : lam) v /= scalarScale();

            ps.setBoundaryCondition(bcTypeMechanics(g));
            ps.set("bc_values", bcValuesMechanics(g));
            ps.set("source", sourceMechanics(g));
            ps.setStiffness(FourthOrderTensor(mu, lam));
            ps.set("time_step", time_.time_step);
            ps.set("biot_alpha", biotAlpha(g));
        } else if (g.dim() == nd_ - 1) {
            ps.set("friction_coefficient", frictionCoefficient(g));
            ps.set("time_step", time_.time_step);
        }
        initializeData(gb.data(i).parameters, keys::MECHANICS, ps);
    }
    for (int e = 0; e < gb.numEdges(); ++e) {
        initializeData(gb.edge(e).parameters, keys::MECHANICS, ParameterSet());
    }
}

void ContactMechanicsBiot::setScalarParameters() {
    GridBucket& gb = gridBucket();
    const double aperture = config_.material.aperture;
    for (int i = 0; i < gb.numGrids(); ++i) {
        const Grid& g = gb.grid(i);
        ParameterSet ps;
        ps.setBoundaryCondition(bcTypeScalar(g));
        ps.set("bc_values", bcValuesScalar(g));
        ps.set("source", sourceScalar(g));
        ps.setPermeability(SecondOrderTensor(permeability(g)));
        ps.set("mass_weight", config_.material.mass_weight);
        ps.set("biot_alpha", biotAlpha(g));
        ps.set("time_step", time_.time_step);
        ps.set("aperture", aperture);
        initializeData(gb.data(i).parameters, keys::FLOW, ps);
    }

    // Normal diffusivity kappa_n = k / (a / 2) of the lower-dimensional cell
    for (int e = 0; e < gb.numEdges(); ++e) {
        MortarGrid& mg = gb.edge(e);
        const std::vector<double> k = permeability(gb.grid(mg.secondary));
        std::vector<double> kn(mg.numCells());
        for (int m = 0; m < mg.numCells(); ++m) {
            kn[m] = 2.0 * k[mg.face_cell_pairs[m].second] / aperture;
        }
        ParameterSet ps;
        ps.set("normal_diffusivity", kn);
        initializeData(mg.parameters, keys::FLOW, ps);
    }
}

void ContactMechanicsBiot::setParameters() {
    setMechanicsParameters();
    setScalarParameters();
}

void ContactMechanicsBiot::initialCondition() {
    GridBucket& gb = gridBucket();
    for (int i = 0; i < gb.numGrids(); ++i) {
        const int nc = gb.grid(i).numCells();
        auto& state = gb.data(i).state;
        if (gb.grid(i).dim() == nd_) {
            state[keys::DISPLACEMENT].assign(3 * nc, 0.0);
        }
        state[keys::DISPLACEMENT_EXPORT].assign(3 * nc, 0.0);
        state[keys::PRESSURE].assign(nc, 0.0);
    }
}

// ============================================================================
// Simulation lifecycle
// ============================================================================

void ContactMechanicsBiot::prepareSimulation() {
    Logger& log = ctx_.logger();

    createGrid(false);
    nd_ = gb_->dimMax();
    initialCondition();
    setParameters();

    std::ostringstream oss;
    oss << "Discretizing " << gb_->numGrids() << " grids, " << gb_->numEdges()
        << " interfaces, " << gb_->numCells() << " cells";
    log.info("ContactMechanicsBiot", oss.str());

    assembler_->discretize(*gb_);
    log.debug("ContactMechanicsBiot", "Degrees of freedom: " + std::to_string(assembler_->numDofs()));

    setViz();
    prepared_ = true;
}

std::vector<double> ContactMechanicsBiot::assembleAndSolveLinearSystem(double tol) {
    if (!prepared_) {
        throw std::logic_error("prepareSimulation() must be called before solving");
    }
    assembler_->assemble(*gb_);
    std::vector<double> x = assembler_->solve(tol);
    ctx_.logger().debug("ContactMechanicsBiot",
                        "Linear solver (" + toString(assembler_->solverType()) + ") used " +
                        std::to_string(assembler_->lastIterations()) + " iterations");
    return x;
}

void ContactMechanicsBiot::setMechanicsOnly(bool on) {
    assembler_->setMechanicsOnly(on);
    prepared_ = false;
}

void ContactMechanicsBiot::afterNewtonConvergence(const std::vector<double>& solution,
                                                  double error, int iterations) {
    assembler_->distribute(*gb_, solution);
    std::ostringstream oss;
    oss << "Solution distributed at step " << time_.step;
    if (iterations > 0) {
        oss << " after " << iterations << " iterations, error " << error;
    }
    ctx_.logger().debug("ContactMechanicsBiot", oss.str());
}

void ContactMechanicsBiot::storeExportedDisplacement() {
    GridBucket& gb = gridBucket();
    const int i = gb.gridsOfDimension(nd_).front();
    const int dim = gb.grid(i).dim();
    const int nc = gb.grid(i).numCells();
    GridData& data = gb.data(i);

    const std::vector<double>& u = data.state.at(keys::DISPLACEMENT);
    if (u.size() != static_cast<size_t>(dim) * nc) {
        throw std::logic_error("Displacement does not match the number of cells");
    }
    std::vector<double>& exported = data.state[keys::DISPLACEMENT_EXPORT];
    exported.assign(u.size(), 0.0);
    // The cell-major solution already is the dim x nc column-major layout
    ColumnMajorArray field(exported, dim);
    for (int c = 0; c < nc; ++c) {
        for (int d = 0; d < dim; ++d) field(d, c) = u[dim * c + d];
    }
}

void ContactMechanicsBiot::setViz() {
    viz_ = std::make_unique<Exporter>(gridBucket(), config_.output.file_name, ctx_.outputFolder());
}

void ContactMechanicsBiot::exportStep() {
    exporter().writeVtk({keys::DISPLACEMENT_EXPORT, keys::PRESSURE}, time_.step, time_.time);
}

void ContactMechanicsBiot::exportPvd() {
    exporter().writePvd();
}

} // namespace GTS
