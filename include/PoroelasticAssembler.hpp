#ifndef POROELASTIC_ASSEMBLER_HPP
#define POROELASTIC_ASSEMBLER_HPP

#include "GTS.hpp"
#include <array>
#include <map>
#include <vector>

namespace GTS {

/**
 * @brief Cell-centred finite-volume discretization of mixed-dimensional Biot
 *        poroelasticity, assembled into PETSc Mat/Vec and solved with KSP
 *
 * Unknowns:
 *   - highest-dimensional grid: displacement (3 per cell, cell-major) followed
 *     by pressure (1 per cell)
 *   - fracture and intersection grids: pressure (1 per cell)
 *
 * Discretization:
 *   - Flow: two-point flux approximation with harmonic averaging of the half
 *     transmissibilities k A a^(Nd-d) / |n . (x_f - x_c)|. Faces coupled to a
 *     lower-dimensional grid are skipped; the flux goes through the interface
 *     with transmissibility t_h t_n / (t_h + t_n), t_n = normal_diffusivity A.
 *   - Mechanics: two-point stress approximation with normal stiffness
 *     (2 mu + lambda) A / d and tangential stiffness mu A / d per half face.
 *   - Coupling: alpha A n p_f in the momentum balance and the discrete
 *     divergence alpha sum A n . (u_f - u_f^old) in the mass balance.
 *   - Time: implicit Euler, mass_weight V a^(Nd-d) (p - p^old).
 *
 * Parameters (keyword "mechanics" on the highest-dimensional grid, "flow" on
 * every grid, "flow" on every interface) are read from the grid bucket;
 * missing keys throw std::out_of_range naming the key. Old values are read
 * from the state fields "u" and "p".
 *
 * In mechanics-only mode the unknowns are the displacements alone, the flow
 * parameters are not read and the pressure coupling is dropped.
 */
class PoroelasticAssembler {
public:
    explicit PoroelasticAssembler(MPI_Comm comm = PETSC_COMM_SELF);
    ~PoroelasticAssembler();

    PoroelasticAssembler(const PoroelasticAssembler&) = delete;
    PoroelasticAssembler& operator=(const PoroelasticAssembler&) = delete;

    /**
     * @brief Build the dof map and the time-invariant face coefficients
     *
     * Must be called again if the grids or the material parameters change.
     */
    void discretize(const GridBucket& gb);

    // Assemble matrix and right-hand side for the current state
    void assemble(const GridBucket& gb);

    // Solve A x = b
    std::vector<double> solve(double tol);

    // Solve A dx = b - A x for the increment of an iterate
    std::vector<double> solveIncrement(const std::vector<double>& iterate, double tol);

    // ||b - A x||_2
    double residualNorm(const std::vector<double>& x);

    // Write displacement ("u") and pressure ("p") of x into the grid states
    void distribute(GridBucket& gb, const std::vector<double>& x) const;

    // Current state fields gathered into a global vector
    std::vector<double> stateVector(const GridBucket& gb) const;

    // Takes effect at the next discretize()
    void setMechanicsOnly(bool on) {
        mechanics_only_ = on;
        discretized_ = false;
        assembled_ = false;
    }
    bool mechanicsOnly() const { return mechanics_only_; }

    void setSolverType(SolverType type) { solver_type_ = type; }
    SolverType solverType() const { return solver_type_; }

    bool isDiscretized() const { return discretized_; }
    int numDofs() const { return num_dofs_; }
    int displacementDof(int cell, int component) const;
    int pressureDof(int grid, int cell) const;
    int lastIterations() const { return last_iterations_; }

private:
    struct FlowCoefficients {
        std::vector<std::array<double, 2>> half;   ///< per face and side
        std::vector<double> trans;                 ///< combined, 0 on interface faces
        std::vector<char> interface_face;
        double cross_section = 1.0;
    };

    struct MechanicsCoefficients {
        std::vector<double> normal;        ///< combined normal stiffness per face
        std::vector<double> tangential;    ///< combined tangential stiffness per face
    };

    struct InterfaceCoupling {
        int high_grid;
        int high_cell;
        int low_grid;
        int low_cell;
        double trans;
    };

    void discretizeFlow(const GridBucket& gb);
    void assembleFlow(const GridBucket& gb, std::vector<std::map<PetscInt, PetscScalar>>& rows,
                      std::vector<PetscScalar>& rhs) const;

    PetscErrorCode buildMatrix(const std::vector<std::map<PetscInt, PetscScalar>>& rows,
                               const std::vector<PetscScalar>& rhs);
    PetscErrorCode setupKSP(double tol);
    PetscErrorCode solveSystem(Vec b, Vec x, double tol);
    PetscErrorCode computeResidual(const std::vector<double>& x, Vec r);
    void destroySystem();

    MPI_Comm comm_;
    Mat matrix_;
    Vec rhs_;
    KSP ksp_;

    SolverType solver_type_ = SolverType::DIRECT;
    bool mechanics_only_ = false;
    bool discretized_ = false;
    bool assembled_ = false;
    int last_iterations_ = 0;
    KSPConvergedReason last_reason_ = KSP_CONVERGED_ITERATING;

    int nd_ = 3;
    int nd_grid_ = -1;
    int num_dofs_ = 0;
    std::vector<int> offsets_;

    std::vector<FlowCoefficients> flow_;
    MechanicsCoefficients mechanics_;
    std::vector<InterfaceCoupling> couplings_;
    std::map<int, std::pair<int, int>> fracture_face_cells_;   ///< Nd face -> (grid, cell)
};

} // namespace GTS

#endif // POROELASTIC_ASSEMBLER_HPP
