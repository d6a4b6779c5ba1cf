#ifndef ISC_SETUP_HPP
#define ISC_SETUP_HPP

#include "GTS.hpp"
#include <memory>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Which model a run drives
 */
enum class ModelKind {
    BIOT,           // Time-dependent poroelastic model
    MECHANICS       // Stationary contact mechanics, one Newton solve
};

/**
 * @brief Outcome of one model run
 */
struct RunSummary {
    std::string folder;
    int steps = 0;
    double end_time = 0.0;
    int num_cells = 0;
    int num_dofs = 0;
    double max_slip_tendency = 0.0;
};

/**
 * @brief Mesh the ISC domain at n_refinements + 1 levels
 *
 * Level 0 uses mesh_args; each further level refines the previous one. Every
 * hierarchy gets its own contact projections and fracture names.
 */
std::vector<std::shared_ptr<GridBucket>> createIscDomain(SimulationContext& ctx,
                                                         const FractureNetwork& network,
                                                         const std::vector<std::string>& shearzone_names,
                                                         const MeshArgs& mesh_args,
                                                         int n_refinements = 0);

// Log every setting of a run, one INFO record per group
void logSimulationSetup(Logger& logger, const SimulationConfig& config);

std::string formatTensor(const Tensor3& t);

// Time loop of an existing model in the configured driver mode
RunSummary runModel(IscBiotModel& model, const SimulationConfig& config);

/**
 * @brief Complete ISC run from a configuration
 *
 * Creates the visualization folder and results.log, logs the setup and the
 * in-situ stress tensor, builds the model and runs the time loop.
 */
RunSummary runBiotModel(const SimulationConfig& config, MPI_Comm comm = PETSC_COMM_WORLD);

// Stationary mechanics solve of an existing model
RunSummary runStationary(IscBiotModel& model, const SimulationConfig& config);

/**
 * @brief Stationary contact-mechanics run from a configuration
 *
 * Same setup and logging as runBiotModel, but the model carries displacement
 * unknowns only and is solved once with the Newton options, without a time
 * loop. Pressures stay at their initial value of zero.
 */
RunSummary runMechanicsModel(const SimulationConfig& config, MPI_Comm comm = PETSC_COMM_WORLD);

/**
 * @brief Run the model on a sequence of uniformly refined grids
 *
 * Level k writes to <viz_folder>/level_<k>.
 */
std::vector<RunSummary> convergenceStudy(const SimulationConfig& config, int n_refinements,
                                         MPI_Comm comm = PETSC_COMM_WORLD,
                                         ModelKind kind = ModelKind::BIOT);

} // namespace GTS

#endif // ISC_SETUP_HPP
