#ifndef TIME_STEPPER_HPP
#define TIME_STEPPER_HPP

#include "GTS.hpp"
#include <string>
#include <vector>

namespace GTS {

enum class StepperState {
    INITIALIZED,
    STEPPING,
    CONVERGED_STEP,
    FINISHED
};

std::string toString(StepperState state);

/**
 * @brief Fixed-step time loop of a Biot model
 *
 * Prepares the model if needed, zeroes the exported displacement on the
 * lower-dimensional grids and steps while time < end_time:
 *   time += time_step, step += 1, solve (single linear solve or Newton),
 *   distribute the solution, copy "u" as a dim x num_cells column-major
 *   array into "u_", export a snapshot.
 * The PVD index is written once the loop ends. Exceptions propagate and
 * leave the state at STEPPING; snapshots already written remain.
 */
class TimeStepper {
public:
    explicit TimeStepper(ContactMechanicsBiot& model, double tol = 1e-10);

    // Switch to a Newton solve per step
    void setNewton(const NewtonOptions& options);

    void run();

    StepperState state() const { return state_; }
    int stepsTaken() const { return steps_taken_; }
    DriverMode mode() const { return mode_; }

    // Newton error of every step (0 for single-shot steps)
    const std::vector<double>& errors() const { return errors_; }

private:
    void advance();

    ContactMechanicsBiot& model_;
    double tol_;
    DriverMode mode_ = DriverMode::SINGLE_SHOT;
    NewtonOptions newton_;
    StepperState state_ = StepperState::INITIALIZED;
    int steps_taken_ = 0;
    std::vector<double> errors_;
};

} // namespace GTS

#endif // TIME_STEPPER_HPP
