#include "IscBiotModel.hpp"
#include "ContactDiagnostics.hpp"
#include "MeshGenerator.hpp"
#include "StressTensor.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace GTS {

namespace {

IntersectionTable loadTable(const SimulationConfig& config) {
    return IntersectionTable::fromCsv(resolveIntersectionFile(config.data_path, config.data_aliases));
}

} // namespace

IscBiotModel::IscBiotModel(SimulationContext& ctx, const SimulationConfig& config)
    : ContactMechanicsBiot(ctx, config),
      table_(loadTable(config)),
      network_(config.shearzone_names, table_, config.box),
      stress_(iscStressTensor()) {
    initialize(nullptr);
}

IscBiotModel::IscBiotModel(SimulationContext& ctx, const SimulationConfig& config,
                           IntersectionTable table, FractureNetwork network,
                           std::shared_ptr<GridBucket> gb)
    : ContactMechanicsBiot(ctx, config),
      table_(std::move(table)),
      network_(std::move(network)),
      stress_(iscStressTensor()) {
    initialize(std::move(gb));
}

void IscBiotModel::initialize(std::shared_ptr<GridBucket> gb) {
    ctx_.logger().info("IscBiotModel", "Running: contact mechanics biot on ISC dataset");
    ctx_.logger().info("IscBiotModel", "Visualization folder path: " + ctx_.outputFolder());

    if (gb) {
        adoptGridBucket(std::move(gb));
    } else {
        createGrid(false);
    }
    wellCells();
}

void IscBiotModel::adoptGridBucket(std::shared_ptr<GridBucket> gb) {
    validateFractureNames(*gb, config_.shearzone_names, &network_);
    gb_ = std::move(gb);
    nd_ = gb_->dimMax();
    for (int i : gb_->gridsOfDimension(nd_ - 1)) {
        if (gb_->data(i).projections.size() != static_cast<size_t>(gb_->grid(i).numCells())) {
            setProjections(*gb_);
            break;
        }
    }
}

void IscBiotModel::createGrid(bool overwrite) {
    Logger& log = ctx_.logger();

    if (!gb_ || overwrite) {
        network_.writeVTK(ctx_.outputPath("shearzones.vtk"));

        auto mesher = createMesher(config_.mesh_args);
        log.info("IscBiotModel", "Meshing with " + mesher->name());
        auto mesh = mesher->generate(network_, config_.mesh_args,
                                     ctx_.outputPath("gmsh_frac_file"), 0);

        gb_ = buildGridBucket(*mesh, network_);
        setProjections(*gb_);
        validateFractureNames(*gb_, config_.shearzone_names, &network_);
        nd_ = gb_->dimMax();
        prepared_ = false;

        std::ostringstream oss;
        oss << "Grid bucket: " << gb_->numGrids() << " grids, " << gb_->numEdges()
            << " interfaces";
        for (int d = nd_; d >= gb_->dimMin(); --d) {
            int cells = 0;
            for (int i : gb_->gridsOfDimension(d)) cells += gb_->grid(i).numCells();
            oss << ", " << cells << " cells of dimension " << d;
        }
        log.info("IscBiotModel", oss.str());

        // A rebuilt bucket has lost its well tags
        if (overwrite) wellCells();
    } else {
        if (nd_ == 0) {
            throw std::logic_error("Grid bucket exists but its dimension is unset");
        }
        // Fracture grids must carry their names
        for (int i : gb_->gridsOfDimension(nd_ - 1)) {
            if (!gb_->grid(i).name) {
                throw std::logic_error("Fracture grid " + std::to_string(i) + " has no name");
            }
        }
        for (const auto& name : config_.shearzone_names) {
            if (gb_->findByName(name) < 0) {
                throw std::logic_error("No fracture grid named " + name);
            }
        }
    }
}

BoundaryCondition IscBiotModel::bcTypeScalar(const Grid& g) const {
    BoundarySides sides = domainBoundarySides(g);
    return BoundaryCondition(g, BoundarySides::indices(sides.bottom), BoundaryType::DIRICHLET);
}

std::vector<double> IscBiotModel::bcValuesScalar(const Grid& g) const {
    BoundarySides sides = domainBoundarySides(g);
    std::vector<double> values(g.numFaces(), 0.0);
    for (int f : BoundarySides::indices(sides.top)) values[f] = 1.0;
    return values;
}

double IscBiotModel::sourceFlowRate() const {
    const double liters = 3.0;
    return liters * units::MILLI * std::pow(units::METER / lengthScale(), nd_);
}

std::vector<double> IscBiotModel::sourceScalar(const Grid& g) const {
    auto it = g.tags.find(keys::WELL_CELLS);
    if (it == g.tags.end()) {
        throw std::out_of_range("Missing grid tag: " + std::string(keys::WELL_CELLS));
    }
    const double rate = sourceFlowRate();
    std::vector<double> values(g.numCells());
    for (int c = 0; c < g.numCells(); ++c) {
        values[c] = rate * it->second[c] * time_.time_step;
    }
    return values;
}

WellTag IscBiotModel::wellCells() {
    well_ = tagWellCells(gridBucket(), table_, config_.injection, &ctx_.logger());
    return well_;
}

void IscBiotModel::afterNewtonConvergence(const std::vector<double>& solution, double error,
                                          int iterations) {
    ContactMechanicsBiot::afterNewtonConvergence(solution, error, iterations);
    max_slip_tendency_ = evaluateSlipTendency(*gb_, stress_, scalarScale());

    std::ostringstream oss;
    oss << "Maximum slip tendency at step " << time_.step << ": " << max_slip_tendency_;
    ctx_.logger().debug("IscBiotModel", oss.str());
}

void IscBiotModel::exportStep() {
    exporter().writeVtk({keys::DISPLACEMENT_EXPORT, keys::PRESSURE, keys::WELL,
                         keys::SLIP_TENDENCY, keys::COULOMB_STRESS},
                        time_.step, time_.time);
}

} // namespace GTS
