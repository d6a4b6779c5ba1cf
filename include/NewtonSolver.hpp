#ifndef NEWTON_SOLVER_HPP
#define NEWTON_SOLVER_HPP

#include "GTS.hpp"
#include <vector>

namespace GTS {

struct NewtonResult {
    bool converged = false;
    int iterations = 0;
    double error = 0.0;                 ///< Relative increment of the last iteration
    std::vector<double> solution;
};

/**
 * @brief Increment-based Newton iteration for one time step
 *
 * Starting from the stored state, solves J dx = b - A x and updates x until
 * ||dx|| / ||x|| drops below convergence_tol. Exceeding divergence_tol or
 * max_iterations throws std::runtime_error.
 */
class NewtonSolver {
public:
    explicit NewtonSolver(const NewtonOptions& options);

    NewtonResult solve(ContactMechanicsBiot& model, double linear_tol);

    const NewtonOptions& options() const { return options_; }

private:
    NewtonOptions options_;
};

// Time loop with a Newton solve per step
void runTimeDependentModel(ContactMechanicsBiot& model, const NewtonOptions& options,
                           double linear_tol = 1e-10);

/**
 * @brief One Newton solve without a time loop
 *
 * Prepares the model if needed, solves, distributes the solution and
 * exports a single snapshot at step 0 plus the PVD index.
 */
NewtonResult runStationaryModel(ContactMechanicsBiot& model, const NewtonOptions& options,
                                double linear_tol = 1e-10);

} // namespace GTS

#endif // NEWTON_SOLVER_HPP
