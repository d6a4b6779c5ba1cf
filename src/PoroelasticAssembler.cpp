#include "PoroelasticAssembler.hpp"
#include "GridBucket.hpp"
#include "Grid.hpp"
#include "Parameters.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace GTS {

namespace {

void checkPetsc(PetscErrorCode ierr, const std::string& where) {
    if (ierr) {
        throw std::runtime_error("PETSc error " + std::to_string(static_cast<int>(ierr)) +
                                 " in " + where);
    }
}

const ParameterSet& parametersOf(const ParameterMap& store, const std::string& keyword) {
    auto it = store.find(keyword);
    if (it == store.end()) {
        throw std::out_of_range("Missing parameter keyword: " + keyword);
    }
    return it->second;
}

const std::vector<double>& sizedArray(const ParameterSet& params, const std::string& key,
                                      size_t size) {
    const auto& values = params.array(key);
    if (values.size() != size) {
        throw std::invalid_argument("Parameter " + key + " has size " +
                                    std::to_string(values.size()) + ", expected " +
                                    std::to_string(size));
    }
    return values;
}

const std::vector<double>& stateField(const GridData& data, const std::string& key, size_t size) {
    auto it = data.state.find(key);
    if (it == data.state.end()) {
        throw std::out_of_range("Missing state field: " + key);
    }
    if (it->second.size() != size) {
        throw std::invalid_argument("State field " + key + " has size " +
                                    std::to_string(it->second.size()) + ", expected " +
                                    std::to_string(size));
    }
    return it->second;
}

// Distance from cell centre to face along the face normal
double halfDistance(const Grid& g, int f, int c) {
    const Point3& xf = g.faceCenter(f);
    const Point3& xc = g.cellCenter(c);
    const Point3& n = g.faceNormal(f);
    double d = 0.0;
    for (int k = 0; k < 3; ++k) d += n[k] * (xf[k] - xc[k]);
    d = std::abs(d);
    if (d <= 1e-14) {
        throw std::runtime_error("Cell centre lies on one of its faces; degenerate cell " +
                                 std::to_string(c));
    }
    return d;
}

double harmonic(double a, double b) {
    return (a + b) > 0.0 ? a * b / (a + b) : 0.0;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

PoroelasticAssembler::PoroelasticAssembler(MPI_Comm comm)
    : comm_(comm), matrix_(nullptr), rhs_(nullptr), ksp_(nullptr) {}

PoroelasticAssembler::~PoroelasticAssembler() {
    destroySystem();
    if (ksp_) KSPDestroy(&ksp_);
}

void PoroelasticAssembler::destroySystem() {
    if (matrix_) MatDestroy(&matrix_);
    if (rhs_) VecDestroy(&rhs_);
    assembled_ = false;
}

int PoroelasticAssembler::displacementDof(int cell, int component) const {
    return offsets_.at(nd_grid_) + 3 * cell + component;
}

int PoroelasticAssembler::pressureDof(int grid, int cell) const {
    if (mechanics_only_) {
        throw std::logic_error("A mechanics-only system has no pressure unknowns");
    }
    if (grid != nd_grid_) return offsets_.at(grid) + cell;
    const int nc = (offsets_.at(grid + 1) - offsets_.at(grid)) / 4;
    return offsets_[grid] + 3 * nc + cell;
}

// ============================================================================
// Discretization
// ============================================================================

void PoroelasticAssembler::discretize(const GridBucket& gb) {
    nd_ = gb.dimMax();
    const auto top = gb.gridsOfDimension(nd_);
    if (top.size() != 1) {
        throw std::invalid_argument("Expected exactly one grid of dimension " +
                                    std::to_string(nd_) + ", found " +
                                    std::to_string(top.size()));
    }
    nd_grid_ = top.front();

    // Dof map
    offsets_.assign(gb.numGrids() + 1, 0);
    for (int i = 0; i < gb.numGrids(); ++i) {
        int nc = gb.grid(i).numCells();
        if (i == nd_grid_) {
            offsets_[i + 1] = offsets_[i] + (mechanics_only_ ? 3 : 4) * nc;
        } else {
            offsets_[i + 1] = offsets_[i] + (mechanics_only_ ? 0 : nc);
        }
    }
    num_dofs_ = offsets_.back();

    // Elastic face stiffness on the highest-dimensional grid
    {
        const Grid& g = gb.grid(nd_grid_);
        const ParameterSet& params = parametersOf(gb.data(nd_grid_).parameters, keys::MECHANICS);
        const FourthOrderTensor& C = params.stiffness();
        if (static_cast<int>(C.mu.size()) != g.numCells()) {
            throw std::invalid_argument("Stiffness must have one Lame pair per cell");
        }
        mechanics_.normal.assign(g.numFaces(), 0.0);
        mechanics_.tangential.assign(g.numFaces(), 0.0);
        for (int f = 0; f < g.numFaces(); ++f) {
            const auto& cells = g.faceCells(f);
            double tn[2] = {0.0, 0.0};
            double tt[2] = {0.0, 0.0};
            for (int s = 0; s < 2; ++s) {
                if (cells[s] < 0) continue;
                const int c = cells[s];
                const double w = g.faceArea(f) / halfDistance(g, f, c);
                tn[s] = (2.0 * C.mu[c] + C.lambda[c]) * w;
                tt[s] = C.mu[c] * w;
            }
            if (g.isBoundaryFace(f)) {
                mechanics_.normal[f] = tn[0];
                mechanics_.tangential[f] = tt[0];
            } else {
                mechanics_.normal[f] = harmonic(tn[0], tn[1]);
                mechanics_.tangential[f] = harmonic(tt[0], tt[1]);
            }
        }
    }

    flow_.clear();
    couplings_.clear();
    fracture_face_cells_.clear();
    if (!mechanics_only_) discretizeFlow(gb);

    destroySystem();
    discretized_ = true;
}

void PoroelasticAssembler::discretizeFlow(const GridBucket& gb) {
    // Flow transmissibilities
    flow_.assign(gb.numGrids(), FlowCoefficients());
    for (int i = 0; i < gb.numGrids(); ++i) {
        const Grid& g = gb.grid(i);
        const ParameterSet& params = parametersOf(gb.data(i).parameters, keys::FLOW);
        const auto& k = params.permeability().kxx;
        if (static_cast<int>(k.size()) != g.numCells()) {
            throw std::invalid_argument("Permeability must have one value per cell");
        }
        FlowCoefficients& fc = flow_[i];
        fc.cross_section = std::pow(params.scalar("aperture"), nd_ - g.dim());
        fc.half.assign(g.numFaces(), {0.0, 0.0});
        fc.trans.assign(g.numFaces(), 0.0);
        fc.interface_face.assign(g.numFaces(), 0);

        auto tag = g.tags.find(keys::FRACTURE_FACES);
        for (int f = 0; f < g.numFaces(); ++f) {
            const auto& cells = g.faceCells(f);
            for (int s = 0; s < 2; ++s) {
                if (cells[s] < 0) continue;
                fc.half[f][s] = k[cells[s]] * g.faceArea(f) * fc.cross_section /
                                halfDistance(g, f, cells[s]);
            }
            if (tag != g.tags.end() && tag->second.at(f) > 0.5) {
                fc.interface_face[f] = 1;
                continue;
            }
            fc.trans[f] = g.isBoundaryFace(f) ? fc.half[f][0] : harmonic(fc.half[f][0], fc.half[f][1]);
        }
    }

    // Interfaces
    for (int e = 0; e < gb.numEdges(); ++e) {
        const MortarGrid& mg = gb.edge(e);
        const Grid& high = gb.grid(mg.primary);
        const ParameterSet& params = parametersOf(mg.parameters, keys::FLOW);
        const auto& kn = sizedArray(params, "normal_diffusivity", mg.numCells());

        for (int m = 0; m < mg.numCells(); ++m) {
            const int f = mg.face_cell_pairs[m].first;
            const int lc = mg.face_cell_pairs[m].second;
            const double tn = kn[m] * high.faceArea(f) * flow_[mg.primary].cross_section;
            const auto& cells = high.faceCells(f);
            for (int s = 0; s < 2; ++s) {
                if (cells[s] < 0) continue;
                double t = harmonic(flow_[mg.primary].half[f][s], tn);
                couplings_.push_back({mg.primary, cells[s], mg.secondary, lc, t});
            }
            if (mg.primary == nd_grid_) {
                fracture_face_cells_[f] = {mg.secondary, lc};
            }
        }
    }
}

// ============================================================================
// Assembly
// ============================================================================

void PoroelasticAssembler::assemble(const GridBucket& gb) {
    if (!discretized_) {
        throw std::logic_error("assemble() called before discretize()");
    }
    if (offsets_.size() != static_cast<size_t>(gb.numGrids() + 1)) {
        throw std::logic_error("Grid bucket changed since discretize()");
    }

    std::vector<std::map<PetscInt, PetscScalar>> rows(num_dofs_);
    std::vector<PetscScalar> rhs(num_dofs_, 0.0);
    auto add = [&rows](int r, int c, double v) { rows[r][c] += v; };

    const Grid& g = gb.grid(nd_grid_);
    const GridData& gd = gb.data(nd_grid_);
    const int nc = g.numCells();
    const int nf = g.numFaces();
    const bool coupled = !mechanics_only_;

    // Momentum balance
    const ParameterSet& mech = parametersOf(gd.parameters, keys::MECHANICS);
    const BoundaryConditionVectorial& mech_bc = mech.bcVectorial();
    const auto& mech_bc_values = sizedArray(mech, "bc_values", 3 * nf);
    const auto& body_force = sizedArray(mech, "source", 3 * nc);
    const double alpha_mech = mech.scalar("biot_alpha");

    const BoundaryCondition* flow_bc = nullptr;
    const std::vector<double>* flow_bc_values = nullptr;
    if (coupled) {
        const ParameterSet& flow = parametersOf(gd.parameters, keys::FLOW);
        flow_bc = &flow.bc();
        flow_bc_values = &sizedArray(flow, "bc_values", nf);
    }

    for (int f = 0; f < nf; ++f) {
        const Point3& n = g.faceNormal(f);
        const double A = g.faceArea(f);
        const double tn = mechanics_.normal[f];
        const double tt = mechanics_.tangential[f];
        double K[3][3];
        for (int d = 0; d < 3; ++d) {
            for (int e = 0; e < 3; ++e) {
                K[d][e] = (d == e ? tt : 0.0) + (tn - tt) * n[d] * n[e];
            }
        }

        const auto& cells = g.faceCells(f);
        const int c0 = cells[0];
        if (!g.isBoundaryFace(f)) {
            const int c1 = cells[1];
            for (int d = 0; d < 3; ++d) {
                for (int e = 0; e < 3; ++e) {
                    add(displacementDof(c0, d), displacementDof(c0, e), K[d][e]);
                    add(displacementDof(c0, d), displacementDof(c1, e), -K[d][e]);
                    add(displacementDof(c1, d), displacementDof(c1, e), K[d][e]);
                    add(displacementDof(c1, d), displacementDof(c0, e), -K[d][e]);
                }
            }
            if (!coupled) continue;

            auto frac = fracture_face_cells_.find(f);
            for (int d = 0; d < 3; ++d) {
                const double coef = alpha_mech * A * n[d];
                if (frac != fracture_face_cells_.end()) {
                    const int pf = pressureDof(frac->second.first, frac->second.second);
                    add(displacementDof(c0, d), pf, coef);
                    add(displacementDof(c1, d), pf, -coef);
                } else {
                    for (int c : {c0, c1}) {
                        add(displacementDof(c0, d), pressureDof(nd_grid_, c), 0.5 * coef);
                        add(displacementDof(c1, d), pressureDof(nd_grid_, c), -0.5 * coef);
                    }
                }
            }
        } else {
            for (int d = 0; d < 3; ++d) {
                const int row = displacementDof(c0, d);
                if (mech_bc.isDirichlet(f, d)) {
                    for (int e = 0; e < 3; ++e) {
                        if (!mech_bc.isDirichlet(f, e)) continue;
                        add(row, displacementDof(c0, e), K[d][e]);
                        rhs[row] += K[d][e] * mech_bc_values[3 * f + e];
                    }
                } else {
                    rhs[row] += mech_bc_values[3 * f + d];
                }
                if (!coupled) continue;

                const double coef = alpha_mech * A * n[d];
                if (flow_bc->isDirichlet(f)) {
                    rhs[row] -= coef * (*flow_bc_values)[f];
                } else {
                    add(row, pressureDof(nd_grid_, c0), coef);
                }
            }
        }
    }
    for (int c = 0; c < nc; ++c) {
        for (int d = 0; d < 3; ++d) {
            rhs[displacementDof(c, d)] += body_force[3 * c + d];
        }
    }

    if (coupled) assembleFlow(gb, rows, rhs);

    checkPetsc(buildMatrix(rows, rhs), "matrix assembly");
    assembled_ = true;
}

void PoroelasticAssembler::assembleFlow(const GridBucket& gb,
                                        std::vector<std::map<PetscInt, PetscScalar>>& rows,
                                        std::vector<PetscScalar>& rhs) const {
    auto add = [&rows](int r, int c, double v) { rows[r][c] += v; };

    const Grid& g = gb.grid(nd_grid_);
    const GridData& gd = gb.data(nd_grid_);
    const int nc = g.numCells();
    const int nf = g.numFaces();
    const BoundaryConditionVectorial& mech_bc =
        parametersOf(gd.parameters, keys::MECHANICS).bcVectorial();
    const double alpha_flow = parametersOf(gd.parameters, keys::FLOW).scalar("biot_alpha");
    const auto& u_old = stateField(gd, keys::DISPLACEMENT, 3 * nc);

    // Volumetric strain in the mass balance of the highest-dimensional grid
    for (int f = 0; f < nf; ++f) {
        const Point3& n = g.faceNormal(f);
        const double A = g.faceArea(f);
        const auto& cells = g.faceCells(f);
        if (!g.isBoundaryFace(f)) {
            for (int s = 0; s < 2; ++s) {
                const int row = pressureDof(nd_grid_, cells[s]);
                const double sign = s == 0 ? 1.0 : -1.0;
                for (int d = 0; d < 3; ++d) {
                    const double coef = 0.5 * alpha_flow * A * sign * n[d];
                    add(row, displacementDof(cells[0], d), coef);
                    add(row, displacementDof(cells[1], d), coef);
                    rhs[row] += coef * (u_old[3 * cells[0] + d] + u_old[3 * cells[1] + d]);
                }
            }
        } else {
            const int c0 = cells[0];
            const int row = pressureDof(nd_grid_, c0);
            for (int d = 0; d < 3; ++d) {
                if (mech_bc.isDirichlet(f, d)) continue;
                const double coef = alpha_flow * A * n[d];
                add(row, displacementDof(c0, d), coef);
                rhs[row] += coef * u_old[3 * c0 + d];
            }
        }
    }

    // Mass balance on every grid
    for (int i = 0; i < gb.numGrids(); ++i) {
        const Grid& gi = gb.grid(i);
        const GridData& di = gb.data(i);
        const ParameterSet& fp = parametersOf(di.parameters, keys::FLOW);
        const BoundaryCondition& bc = fp.bc();
        const auto& bc_values = sizedArray(fp, "bc_values", gi.numFaces());
        const auto& source = sizedArray(fp, "source", gi.numCells());
        const double mass_weight = fp.scalar("mass_weight");
        const double dt = fp.scalar("time_step");
        const auto& p_old = stateField(di, keys::PRESSURE, gi.numCells());
        const FlowCoefficients& fc = flow_[i];

        for (int c = 0; c < gi.numCells(); ++c) {
            const int row = pressureDof(i, c);
            const double accumulation = mass_weight * gi.cellVolume(c) * fc.cross_section;
            add(row, row, accumulation);
            rhs[row] += accumulation * p_old[c] + source[c];
        }

        for (int f = 0; f < gi.numFaces(); ++f) {
            if (fc.interface_face[f]) continue;
            const auto& cells = gi.faceCells(f);
            const int r0 = pressureDof(i, cells[0]);
            if (!gi.isBoundaryFace(f)) {
                const int r1 = pressureDof(i, cells[1]);
                const double T = dt * fc.trans[f];
                add(r0, r0, T);
                add(r0, r1, -T);
                add(r1, r1, T);
                add(r1, r0, -T);
            } else if (bc.isDirichlet(f)) {
                const double T = dt * fc.trans[f];
                add(r0, r0, T);
                rhs[r0] += T * bc_values[f];
            } else {
                rhs[r0] -= dt * bc_values[f];
            }
        }
    }

    // Interface fluxes, positive from the higher- to the lower-dimensional grid
    for (const auto& ic : couplings_) {
        const double dt = parametersOf(gb.data(ic.low_grid).parameters, keys::FLOW).scalar("time_step");
        const int rh = pressureDof(ic.high_grid, ic.high_cell);
        const int rl = pressureDof(ic.low_grid, ic.low_cell);
        const double T = dt * ic.trans;
        add(rh, rh, T);
        add(rh, rl, -T);
        add(rl, rl, T);
        add(rl, rh, -T);
    }
}

PetscErrorCode PoroelasticAssembler::buildMatrix(const std::vector<std::map<PetscInt, PetscScalar>>& rows,
                                                 const std::vector<PetscScalar>& rhs) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    destroySystem();
    const PetscInt n = static_cast<PetscInt>(rows.size());

    std::vector<PetscInt> nnz(n);
    for (PetscInt r = 0; r < n; ++r) {
        nnz[r] = std::max<PetscInt>(1, static_cast<PetscInt>(rows[r].size()));
    }
    ierr = MatCreateSeqAIJ(comm_, n, n, 0, nnz.data(), &matrix_); CHKERRQ(ierr);
    ierr = MatSetOption(matrix_, MAT_NEW_NONZERO_ALLOCATION_ERR, PETSC_TRUE); CHKERRQ(ierr);

    std::vector<PetscInt> cols;
    std::vector<PetscScalar> vals;
    for (PetscInt r = 0; r < n; ++r) {
        cols.clear();
        vals.clear();
        for (const auto& [c, v] : rows[r]) {
            cols.push_back(c);
            vals.push_back(v);
        }
        if (cols.empty()) continue;
        ierr = MatSetValues(matrix_, 1, &r, static_cast<PetscInt>(cols.size()), cols.data(),
                            vals.data(), INSERT_VALUES); CHKERRQ(ierr);
    }
    ierr = MatAssemblyBegin(matrix_, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    ierr = MatAssemblyEnd(matrix_, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);

    std::vector<PetscInt> idx(n);
    for (PetscInt r = 0; r < n; ++r) idx[r] = r;
    ierr = VecCreateSeq(comm_, n, &rhs_); CHKERRQ(ierr);
    ierr = VecSetValues(rhs_, n, idx.data(), rhs.data(), INSERT_VALUES); CHKERRQ(ierr);
    ierr = VecAssemblyBegin(rhs_); CHKERRQ(ierr);
    ierr = VecAssemblyEnd(rhs_); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

// ============================================================================
// Linear solve
// ============================================================================

PetscErrorCode PoroelasticAssembler::setupKSP(double tol) {
    PetscErrorCode ierr;
    PC pc;
    PetscFunctionBeginUser;

    if (!ksp_) {
        ierr = KSPCreate(comm_, &ksp_); CHKERRQ(ierr);
    }
    ierr = KSPSetOperators(ksp_, matrix_, matrix_); CHKERRQ(ierr);
    ierr = KSPGetPC(ksp_, &pc); CHKERRQ(ierr);

    switch (solver_type_) {
        case SolverType::DIRECT:
            ierr = KSPSetType(ksp_, KSPPREONLY); CHKERRQ(ierr);
            ierr = PCSetType(pc, PCLU); CHKERRQ(ierr);
            break;
        case SolverType::ITERATIVE:
            ierr = KSPSetType(ksp_, KSPGMRES); CHKERRQ(ierr);
            ierr = PCSetType(pc, PCILU); CHKERRQ(ierr);
            break;
        case SolverType::AMG:
            ierr = KSPSetType(ksp_, KSPGMRES); CHKERRQ(ierr);
            ierr = PCSetType(pc, PCGAMG); CHKERRQ(ierr);
            break;
    }
    // Absolute tolerance governs; the relative one is kept out of the way
    ierr = KSPSetTolerances(ksp_, 1e-14, tol, PETSC_DEFAULT, 10000); CHKERRQ(ierr);
    ierr = KSPSetFromOptions(ksp_); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode PoroelasticAssembler::solveSystem(Vec b, Vec x, double tol) {
    PetscErrorCode ierr;
    PetscInt its;
    PetscFunctionBeginUser;

    ierr = setupKSP(tol); CHKERRQ(ierr);
    ierr = KSPSolve(ksp_, b, x); CHKERRQ(ierr);
    ierr = KSPGetConvergedReason(ksp_, &last_reason_); CHKERRQ(ierr);
    ierr = KSPGetIterationNumber(ksp_, &its); CHKERRQ(ierr);
    last_iterations_ = static_cast<int>(its);

    PetscFunctionReturn(0);
}

PetscErrorCode PoroelasticAssembler::computeResidual(const std::vector<double>& x, Vec r) {
    PetscErrorCode ierr;
    Vec xv;
    PetscFunctionBeginUser;

    ierr = VecDuplicate(rhs_, &xv); CHKERRQ(ierr);
    std::vector<PetscInt> idx(x.size());
    for (size_t i = 0; i < x.size(); ++i) idx[i] = static_cast<PetscInt>(i);
    ierr = VecSetValues(xv, static_cast<PetscInt>(x.size()), idx.data(), x.data(), INSERT_VALUES); CHKERRQ(ierr);
    ierr = VecAssemblyBegin(xv); CHKERRQ(ierr);
    ierr = VecAssemblyEnd(xv); CHKERRQ(ierr);

    ierr = MatMult(matrix_, xv, r); CHKERRQ(ierr);
    ierr = VecAYPX(r, -1.0, rhs_); CHKERRQ(ierr);
    ierr = VecDestroy(&xv); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

namespace {

std::vector<double> toStdVector(Vec v) {
    PetscInt n;
    const PetscScalar* a;
    checkPetsc(VecGetLocalSize(v, &n), "VecGetLocalSize");
    checkPetsc(VecGetArrayRead(v, &a), "VecGetArrayRead");
    std::vector<double> out(a, a + n);
    checkPetsc(VecRestoreArrayRead(v, &a), "VecRestoreArrayRead");
    return out;
}

} // namespace

std::vector<double> PoroelasticAssembler::solve(double tol) {
    if (!assembled_) {
        throw std::logic_error("solve() called before assemble()");
    }
    Vec x;
    checkPetsc(VecDuplicate(rhs_, &x), "VecDuplicate");
    PetscErrorCode ierr = solveSystem(rhs_, x, tol);
    if (ierr || last_reason_ < 0) {
        VecDestroy(&x);
        checkPetsc(ierr, "KSPSolve");
        throw std::runtime_error(std::string("Linear solver did not converge: ") +
                                 KSPConvergedReasons[last_reason_]);
    }
    std::vector<double> result = toStdVector(x);
    checkPetsc(VecDestroy(&x), "VecDestroy");
    return result;
}

std::vector<double> PoroelasticAssembler::solveIncrement(const std::vector<double>& iterate,
                                                         double tol) {
    if (!assembled_) {
        throw std::logic_error("solveIncrement() called before assemble()");
    }
    if (static_cast<int>(iterate.size()) != num_dofs_) {
        throw std::invalid_argument("Iterate has the wrong size");
    }
    Vec r, dx;
    checkPetsc(VecDuplicate(rhs_, &r), "VecDuplicate");
    checkPetsc(VecDuplicate(rhs_, &dx), "VecDuplicate");
    PetscErrorCode ierr = computeResidual(iterate, r);
    if (!ierr) ierr = solveSystem(r, dx, tol);
    if (ierr || last_reason_ < 0) {
        VecDestroy(&r);
        VecDestroy(&dx);
        checkPetsc(ierr, "KSPSolve");
        throw std::runtime_error(std::string("Linear solver did not converge: ") +
                                 KSPConvergedReasons[last_reason_]);
    }
    std::vector<double> result = toStdVector(dx);
    checkPetsc(VecDestroy(&r), "VecDestroy");
    checkPetsc(VecDestroy(&dx), "VecDestroy");
    return result;
}

double PoroelasticAssembler::residualNorm(const std::vector<double>& x) {
    if (!assembled_) {
        throw std::logic_error("residualNorm() called before assemble()");
    }
    if (static_cast<int>(x.size()) != num_dofs_) {
        throw std::invalid_argument("Vector has the wrong size");
    }
    Vec r;
    PetscReal norm = 0.0;
    checkPetsc(VecDuplicate(rhs_, &r), "VecDuplicate");
    PetscErrorCode ierr = computeResidual(x, r);
    if (!ierr) ierr = VecNorm(r, NORM_2, &norm);
    VecDestroy(&r);
    checkPetsc(ierr, "residual evaluation");
    return static_cast<double>(norm);
}

// ============================================================================
// State transfer
// ============================================================================

void PoroelasticAssembler::distribute(GridBucket& gb, const std::vector<double>& x) const {
    if (static_cast<int>(x.size()) != num_dofs_) {
        throw std::invalid_argument("Solution vector has the wrong size");
    }
    for (int i = 0; i < gb.numGrids(); ++i) {
        const int nc = gb.grid(i).numCells();
        auto& state = gb.data(i).state;
        if (i == nd_grid_) {
            auto first = x.begin() + offsets_[i];
            state[keys::DISPLACEMENT].assign(first, first + 3 * nc);
        }
        if (mechanics_only_) continue;
        std::vector<double>& p = state[keys::PRESSURE];
        p.resize(nc);
        for (int c = 0; c < nc; ++c) p[c] = x[pressureDof(i, c)];
    }
}

std::vector<double> PoroelasticAssembler::stateVector(const GridBucket& gb) const {
    std::vector<double> x(num_dofs_, 0.0);
    for (int i = 0; i < gb.numGrids(); ++i) {
        const int nc = gb.grid(i).numCells();
        const GridData& data = gb.data(i);
        if (i == nd_grid_) {
            const auto& u = stateField(data, keys::DISPLACEMENT, 3 * nc);
            std::copy(u.begin(), u.end(), x.begin() + offsets_[i]);
        }
        if (mechanics_only_) continue;
        const auto& p = stateField(data, keys::PRESSURE, nc);
        for (int c = 0; c < nc; ++c) x[pressureDof(i, c)] = p[c];
    }
    return x;
}

} // namespace GTS
