#include "TimeStepper.hpp"
#include "ContactMechanicsBiot.hpp"
#include "NewtonSolver.hpp"
#include <sstream>
#include <stdexcept>

namespace GTS {

std::string toString(StepperState state) {
    switch (state) {
        case StepperState::INITIALIZED: return "initialized";
        case StepperState::STEPPING: return "stepping";
        case StepperState::CONVERGED_STEP: return "converged_step";
        case StepperState::FINISHED: return "finished";
    }
    return "unknown";
}

TimeStepper::TimeStepper(ContactMechanicsBiot& model, double tol)
    : model_(model), tol_(tol) {}

void TimeStepper::setNewton(const NewtonOptions& options) {
    newton_ = options;
    mode_ = DriverMode::NEWTON;
}

void TimeStepper::run() {
    if (state_ != StepperState::INITIALIZED) {
        throw std::logic_error("Time loop has already run (state " + toString(state_) + ")");
    }
    Logger& log = model_.context().logger();

    if (!model_.isPrepared()) {
        model_.prepareSimulation();
    }

    // Zero exported displacement on the lower-dimensional grids
    GridBucket& gb = model_.gridBucket();
    for (int i = 0; i < gb.numGrids(); ++i) {
        if (gb.grid(i).dim() < model_.Nd()) {
            gb.data(i).state[keys::DISPLACEMENT_EXPORT].assign(3 * gb.grid(i).numCells(), 0.0);
        }
    }

    TimeState& ts = model_.timeState();
    const double eps = 1e-9 * ts.time_step;
    log.info("TimeStepper", "Starting simulation...");

    while (ts.time < ts.end_time - eps) {
        state_ = StepperState::STEPPING;
        advance();
        state_ = StepperState::CONVERGED_STEP;
    }

    log.info("TimeStepper", "Successful simulation.");
    model_.exportPvd();
    state_ = StepperState::FINISHED;
}

void TimeStepper::advance() {
    TimeState& ts = model_.timeState();
    ts.time += ts.time_step;
    ts.step += 1;

    std::ostringstream oss;
    oss.precision(1);
    oss << std::scientific << "Time step " << ts.step << " at time " << ts.time << " of "
        << ts.end_time << " with time step " << ts.time_step;
    model_.context().logger().debug("TimeStepper", oss.str());

    if (mode_ == DriverMode::SINGLE_SHOT) {
        std::vector<double> x = model_.assembleAndSolveLinearSystem(tol_);
        model_.afterNewtonConvergence(x, 0.0, 0);
        errors_.push_back(0.0);
    } else {
        NewtonSolver newton(newton_);
        NewtonResult result = newton.solve(model_, tol_);
        model_.afterNewtonConvergence(result.solution, result.error, result.iterations);
        errors_.push_back(result.error);
    }

    model_.storeExportedDisplacement();
    model_.exportStep();
    ++steps_taken_;
}

} // namespace GTS
