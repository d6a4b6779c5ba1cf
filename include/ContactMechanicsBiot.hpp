#ifndef CONTACT_MECHANICS_BIOT_HPP
#define CONTACT_MECHANICS_BIOT_HPP

#include "GTS.hpp"
#include "BoundaryConditions.hpp"
#include "GridBucket.hpp"
#include "PoroelasticAssembler.hpp"
#include "SimulationContext.hpp"
#include "Visualization.hpp"
#include <memory>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Simulation clock
 *
 * time_step is fixed for the run; step only grows.
 */
struct TimeState {
    double time = 0.0;
    double time_step = 1.0;
    double end_time = 0.0;
    int step = 0;
};

/**
 * @brief Biot poroelasticity with fracture contact mechanics on a grid bucket
 *
 * Owns the grid bucket, the assembler and the exporter, and defines the
 * boundary, source and material hooks that concrete setups override. The
 * defaults are: mechanics Dirichlet on all boundary and fracture faces with
 * zero values and zero body force; flow Dirichlet on all boundary faces
 * with zero values and no source; unit Lame parameters, permeability and
 * Biot coefficient.
 */
class ContactMechanicsBiot {
public:
    ContactMechanicsBiot(SimulationContext& ctx, const SimulationConfig& config);
    virtual ~ContactMechanicsBiot() = default;

    ContactMechanicsBiot(const ContactMechanicsBiot&) = delete;
    ContactMechanicsBiot& operator=(const ContactMechanicsBiot&) = delete;

    // Build (or reuse) the grid bucket
    virtual void createGrid(bool overwrite = false) = 0;

    // Mechanics hooks (highest-dimensional grid)
    virtual BoundaryConditionVectorial bcTypeMechanics(const Grid& g) const;
    virtual std::vector<double> bcValuesMechanics(const Grid& g) const;
    virtual std::vector<double> sourceMechanics(const Grid& g) const;
    virtual std::vector<double> lameMu(const Grid& g) const;
    virtual std::vector<double> lameLambda(const Grid& g) const;
    virtual std::vector<double> frictionCoefficient(const Grid& g) const;

    // Flow hooks (every grid)
    virtual BoundaryCondition bcTypeScalar(const Grid& g) const;
    virtual std::vector<double> bcValuesScalar(const Grid& g) const;
    virtual std::vector<double> sourceScalar(const Grid& g) const;
    virtual std::vector<double> permeability(const Grid& g) const;
    virtual double biotAlpha(const Grid& g) const;

    virtual void setMechanicsParameters();
    virtual void setScalarParameters();
    void setParameters();

    // Zero displacement and pressure on every grid
    virtual void initialCondition();

    /**
     * @brief Grid, initial state, parameters, discretization and exporter
     *
     * Time-invariant coefficients are discretized once here.
     */
    void prepareSimulation();

    // Assemble for the current state and solve
    std::vector<double> assembleAndSolveLinearSystem(double tol);

    // Displacement unknowns only, for stationary mechanics runs
    void setMechanicsOnly(bool on);
    bool mechanicsOnly() const { return assembler_->mechanicsOnly(); }

    // Distribute the converged solution into the grid states
    virtual void afterNewtonConvergence(const std::vector<double>& solution, double error,
                                        int iterations);

    /**
     * @brief Write "u" of the highest-dimensional grid into "u_" as a
     *        dim x num_cells column-major array
     * @throws std::logic_error if "u" does not hold dim values per cell
     */
    void storeExportedDisplacement();

    void setViz();
    virtual void exportStep();
    void exportPvd();

    BoundarySides domainBoundarySides(const Grid& g) const;

    bool hasGrid() const { return static_cast<bool>(gb_); }
    GridBucket& gridBucket();
    const GridBucket& gridBucket() const;
    int Nd() const { return nd_; }

    TimeState& timeState() { return time_; }
    const TimeState& timeState() const { return time_; }
    const SimulationConfig& config() const { return config_; }
    SimulationContext& context() { return ctx_; }
    PoroelasticAssembler& assembler() { return *assembler_; }
    Exporter& exporter();

    bool isPrepared() const { return prepared_; }
    double scalarScale() const { return config_.scales.scalar_scale; }
    double lengthScale() const { return config_.scales.length_scale; }

protected:
    void setTimeParameters();

    SimulationContext& ctx_;
    SimulationConfig config_;
    std::shared_ptr<GridBucket> gb_;
    int nd_ = 0;
    TimeState time_;
    std::unique_ptr<PoroelasticAssembler> assembler_;
    std::unique_ptr<Exporter> viz_;
    bool prepared_ = false;
};

} // namespace GTS

#endif // CONTACT_MECHANICS_BIOT_HPP
