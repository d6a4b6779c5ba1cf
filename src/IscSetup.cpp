#include "IscSetup.hpp"
#include "FractureNetwork.hpp"
#include "GridBucket.hpp"
#include "IscBiotModel.hpp"
#include "IscData.hpp"
#include "MeshGenerator.hpp"
#include "NewtonSolver.hpp"
#include "SimulationContext.hpp"
#include "StressTensor.hpp"
#include "TimeStepper.hpp"
#include <iomanip>
#include <sstream>

namespace GTS {

std::vector<std::shared_ptr<GridBucket>> createIscDomain(SimulationContext& ctx,
                                                         const FractureNetwork& network,
                                                         const std::vector<std::string>& shearzone_names,
                                                         const MeshArgs& mesh_args,
                                                         int n_refinements) {
    if (n_refinements < 0) {
        throw std::invalid_argument("Number of refinements must be non-negative");
    }
    auto mesher = createMesher(mesh_args);
    const std::string stem = ctx.outputPath("gmsh_frac_file");

    std::vector<std::shared_ptr<GridBucket>> buckets;
    for (int level = 0; level <= n_refinements; ++level) {
        auto mesh = mesher->generate(network, mesh_args, stem, level);
        auto gb = buildGridBucket(*mesh, network);
        setProjections(*gb);
        validateFractureNames(*gb, shearzone_names, &network);

        std::ostringstream oss;
        oss << "Refinement level " << level << ": " << gb->numCells() << " cells in "
            << gb->numGrids() << " grids";
        ctx.logger().info("IscSetup", oss.str());
        buckets.push_back(gb);
    }
    return buckets;
}

std::string formatTensor(const Tensor3& t) {
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(4);
    for (int i = 0; i < 3; ++i) {
        oss << (i == 0 ? "[[" : " [");
        for (int j = 0; j < 3; ++j) {
            oss << std::setw(12) << t[i][j] << (j < 2 ? ", " : "");
        }
        oss << (i == 2 ? "]]" : "]\n");
    }
    return oss.str();
}

void logSimulationSetup(Logger& logger, const SimulationConfig& config) {
    const std::string src = "IscSetup";
    std::ostringstream oss;

    logger.info(src, "Visualization folder path: \n " + config.output.viz_folder);
    logger.info(src, "Root file name of results: " + config.output.file_name);
    logger.info(src, "Data path: " + config.data_path);

    const MeshArgs& m = config.mesh_args;
    oss << "Mesh arguments: \n {mesh_size_frac: " << m.mesh_size_frac
        << ", mesh_size_min: " << m.mesh_size_min << ", mesh_size_bound: " << m.mesh_size_bound
        << ", mesher: " << toString(m.mesher) << "}";
    logger.info(src, oss.str());

    const BoundingBox& b = config.box;
    oss.str("");
    oss << "Bounding box: \n {xmin: " << b.xmin << ", xmax: " << b.xmax << ", ymin: " << b.ymin
        << ", ymax: " << b.ymax << ", zmin: " << b.zmin << ", zmax: " << b.zmax << "}";
    logger.info(src, oss.str());

    oss.str("");
    oss << "Shear zones in simulation: \n [";
    for (size_t i = 0; i < config.shearzone_names.size(); ++i) {
        oss << (i ? ", " : "") << config.shearzone_names[i];
    }
    oss << "]";
    logger.info(src, oss.str());

    oss.str("");
    oss << "Variable scaling: \n {scalar_scale: " << config.scales.scalar_scale
        << ", length_scale: " << config.scales.length_scale << "}";
    logger.info(src, oss.str());

    logger.info(src, "Solver type: " + toString(config.solver.type) + ", driver: " +
                         toString(config.solver.mode));

    logger.info(src, "Injection location: \n {shearzone: " + config.injection.shearzone +
                         ", borehole: " + config.injection.borehole + "}");

    oss.str("");
    oss << "Time: num_steps " << config.time.num_steps << ", time_step_factor "
        << config.time.time_step_factor;
    logger.info(src, oss.str());

    oss.str("");
    oss << "Options for Newton solver: \n {max_iterations: " << config.newton.max_iterations
        << ", convergence_tol: " << config.newton.convergence_tol
        << ", divergence_tol: " << config.newton.divergence_tol << "}";
    logger.info(src, oss.str());

    logger.info(src, "Stress tensor: \n" + formatTensor(iscStressTensor()));
}

RunSummary runModel(IscBiotModel& model, const SimulationConfig& config) {
    Logger& log = model.context().logger();
    log.info("IscSetup", "Setup complete. Starting time-dependent simulation");

    TimeStepper stepper(model, config.solver.tolerance);
    if (config.solver.mode == DriverMode::NEWTON) {
        stepper.setNewton(config.newton);
    }
    stepper.run();

    RunSummary summary;
    summary.folder = model.context().outputFolder();
    summary.steps = stepper.stepsTaken();
    summary.end_time = model.timeState().time;
    summary.num_cells = model.gridBucket().numCells();
    summary.num_dofs = model.assembler().numDofs();
    summary.max_slip_tendency = model.maxSlipTendency();

    log.info("IscSetup", "Simulation complete. Time: " + Logger::timestamp());
    return summary;
}

RunSummary runBiotModel(const SimulationConfig& config, MPI_Comm comm) {
    SimulationContext ctx(comm, config.output.viz_folder, config.output.log_file);
    Logger& log = ctx.logger();

    log.info("IscSetup", "Preparing setup for biot simulation on " + Logger::timestamp());
    logSimulationSetup(log, config);

    IscBiotModel model(ctx, config);
    return runModel(model, config);
}

RunSummary runStationary(IscBiotModel& model, const SimulationConfig& config) {
    Logger& log = model.context().logger();
    log.info("IscSetup", "Setup complete. Starting stationary mechanics simulation");

    model.setMechanicsOnly(true);
    NewtonResult result = runStationaryModel(model, config.newton, config.solver.tolerance);

    RunSummary summary;
    summary.folder = model.context().outputFolder();
    summary.steps = 0;
    summary.end_time = model.timeState().time;
    summary.num_cells = model.gridBucket().numCells();
    summary.num_dofs = model.assembler().numDofs();
    summary.max_slip_tendency = model.maxSlipTendency();

    std::ostringstream oss;
    oss << "Simulation complete after " << result.iterations << " Newton iterations. Time: "
        << Logger::timestamp();
    log.info("IscSetup", oss.str());
    return summary;
}

RunSummary runMechanicsModel(const SimulationConfig& config, MPI_Comm comm) {
    SimulationContext ctx(comm, config.output.viz_folder, config.output.log_file);
    Logger& log = ctx.logger();

    log.info("IscSetup", "Preparing setup for mechanics simulation on " + Logger::timestamp());
    logSimulationSetup(log, config);

    IscBiotModel model(ctx, config);
    return runStationary(model, config);
}

std::vector<RunSummary> convergenceStudy(const SimulationConfig& config, int n_refinements,
                                         MPI_Comm comm, ModelKind kind) {
    SimulationContext ctx(comm, config.output.viz_folder, config.output.log_file);
    Logger& log = ctx.logger();

    log.info("IscSetup", std::string("Preparing setup for ") +
                             (kind == ModelKind::MECHANICS ? "mechanics" : "biot") +
                             " convergence study on " + Logger::timestamp());
    logSimulationSetup(log, config);

    IntersectionTable table =
        IntersectionTable::fromCsv(resolveIntersectionFile(config.data_path, config.data_aliases));
    FractureNetwork network(config.shearzone_names, table, config.box);
    network.writeVTK(ctx.outputPath("shearzones.vtk"));

    auto buckets = createIscDomain(ctx, network, config.shearzone_names, config.mesh_args,
                                   n_refinements);
    log.info("IscSetup", "Reporting on " + std::to_string(buckets.size()) + " grid buckets.");

    std::vector<RunSummary> summaries;
    for (size_t k = 0; k < buckets.size(); ++k) {
        SimulationConfig level_config = config;
        level_config.output.viz_folder = ctx.outputPath("level_" + std::to_string(k));
        SimulationContext level_ctx(comm, level_config.output.viz_folder, config.output.log_file);

        IscBiotModel model(level_ctx, level_config, table, network, buckets[k]);
        RunSummary summary = kind == ModelKind::MECHANICS ? runStationary(model, level_config)
                                                          : runModel(model, level_config);

        std::ostringstream oss;
        oss << "Level " << k << ": " << summary.num_cells << " cells, " << summary.num_dofs
            << " dofs, " << summary.steps << " steps, max slip tendency "
            << summary.max_slip_tendency;
        log.info("IscSetup", oss.str());
        summaries.push_back(summary);
    }
    return summaries;
}

} // namespace GTS
