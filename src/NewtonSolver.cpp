#include "NewtonSolver.hpp"
#include "ContactMechanicsBiot.hpp"
#include "TimeStepper.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace GTS {

namespace {

double norm2(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x * x;
    return std::sqrt(s);
}

} // namespace

NewtonSolver::NewtonSolver(const NewtonOptions& options) : options_(options) {
    if (options_.max_iterations < 1) {
        throw std::invalid_argument("Newton max_iterations must be at least 1");
    }
}

NewtonResult NewtonSolver::solve(ContactMechanicsBiot& model, double linear_tol) {
    PoroelasticAssembler& assembler = model.assembler();
    GridBucket& gb = model.gridBucket();
    Logger& log = model.context().logger();

    assembler.assemble(gb);
    NewtonResult result;
    result.solution = assembler.stateVector(gb);

    for (int it = 1; it <= options_.max_iterations; ++it) {
        std::vector<double> dx = assembler.solveIncrement(result.solution, linear_tol);
        for (size_t i = 0; i < dx.size(); ++i) result.solution[i] += dx[i];

        const double x_norm = norm2(result.solution);
        result.error = x_norm > 0.0 ? norm2(dx) / x_norm : norm2(dx);
        result.iterations = it;

        std::ostringstream oss;
        oss << "Newton iteration " << it << ", error " << result.error;
        log.debug("NewtonSolver", oss.str());

        if (!std::isfinite(result.error) || result.error > options_.divergence_tol) {
            std::ostringstream msg;
            msg << "Newton iterations diverged at iteration " << it << " (error " << result.error << ")";
            throw std::runtime_error(msg.str());
        }
        if (result.error < options_.convergence_tol) {
            result.converged = true;
            return result;
        }
    }

    std::ostringstream oss;
    oss << "Newton iterations did not converge in " << options_.max_iterations
        << " iterations; last error " << result.error;
    throw std::runtime_error(oss.str());
}

void runTimeDependentModel(ContactMechanicsBiot& model, const NewtonOptions& options,
                           double linear_tol) {
    TimeStepper stepper(model, linear_tol);
    stepper.setNewton(options);
    stepper.run();
}

NewtonResult runStationaryModel(ContactMechanicsBiot& model, const NewtonOptions& options,
                                double linear_tol) {
    if (!model.isPrepared()) {
        model.prepareSimulation();
    }
    Logger& log = model.context().logger();
    log.info("NewtonSolver", "Starting stationary solve");

    NewtonSolver newton(options);
    NewtonResult result = newton.solve(model, linear_tol);
    model.afterNewtonConvergence(result.solution, result.error, result.iterations);
    model.storeExportedDisplacement();
    model.exportStep();
    model.exportPvd();

    std::ostringstream oss;
    oss << "Stationary solve converged in " << result.iterations << " iterations, error "
        << result.error;
    log.info("NewtonSolver", oss.str());
    return result;
}

} // namespace GTS
