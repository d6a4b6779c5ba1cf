/**
 * @file BoundaryConditions.hpp
 * @brief Face-wise boundary conditions for the flow and mechanics problems
 *
 * Implements:
 * - Scalar conditions (one Dirichlet/Neumann flag per face)
 * - Vectorial conditions (one flag per face and displacement component)
 * - Classification of boundary faces by side of the bounding box
 */

#ifndef BOUNDARY_CONDITIONS_HPP
#define BOUNDARY_CONDITIONS_HPP

#include "GTS.hpp"
#include <vector>

namespace GTS {

/**
 * @brief Types of boundary conditions
 */
enum class BoundaryType {
    DIRICHLET,             // Prescribed value (pressure / displacement)
    NEUMANN                // Prescribed flux / traction
};

/**
 * @brief Scalar boundary condition on every face of a grid
 *
 * Faces not listed are Neumann. Internal faces carry a flag as well, but
 * discretizations only consult it on boundary faces.
 */
class BoundaryCondition {
public:
    BoundaryCondition() = default;
    BoundaryCondition(const Grid& g, const std::vector<int>& faces,
                      BoundaryType type = BoundaryType::DIRICHLET);

    int numFaces() const { return static_cast<int>(types_.size()); }
    BoundaryType type(int f) const { return types_.at(f); }
    bool isDirichlet(int f) const { return types_.at(f) == BoundaryType::DIRICHLET; }
    bool isNeumann(int f) const { return types_.at(f) == BoundaryType::NEUMANN; }
    void setType(int f, BoundaryType type) { types_.at(f) = type; }

    std::vector<int> dirichletFaces() const;

private:
    std::vector<BoundaryType> types_;
};

/**
 * @brief Boundary condition per face and displacement component
 */
class BoundaryConditionVectorial {
public:
    BoundaryConditionVectorial() = default;
    BoundaryConditionVectorial(const Grid& g, const std::vector<int>& faces,
                               BoundaryType type = BoundaryType::DIRICHLET);

    int numFaces() const { return static_cast<int>(types_.size()); }
    bool isDirichlet(int f, int d) const { return types_.at(f)[d] == BoundaryType::DIRICHLET; }
    bool isNeumann(int f, int d) const { return types_.at(f)[d] == BoundaryType::NEUMANN; }
    void setType(int f, int d, BoundaryType type) { types_.at(f)[d] = type; }

    std::vector<int> dirichletFaces() const;   // Faces Dirichlet in every component

private:
    std::vector<std::array<BoundaryType, 3>> types_;
};

/**
 * @brief Face masks of the domain sides
 *
 * Each mask has one entry per face. A face belongs to a side if it is a
 * boundary face and its centre lies within tol of that side of the box.
 */
struct BoundarySides {
    std::vector<int> all_faces;        ///< Indices of all boundary faces
    std::vector<bool> east;            ///< x = xmax
    std::vector<bool> west;            ///< x = xmin
    std::vector<bool> north;           ///< y = ymax
    std::vector<bool> south;           ///< y = ymin
    std::vector<bool> top;             ///< z = zmax
    std::vector<bool> bottom;          ///< z = zmin

    static std::vector<int> indices(const std::vector<bool>& mask);
};

BoundarySides domainBoundarySides(const Grid& g, const BoundingBox& box, double tol);

} // namespace GTS

#endif // BOUNDARY_CONDITIONS_HPP
