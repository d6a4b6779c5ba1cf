#include "BoundaryConditions.hpp"
#include "Grid.hpp"
#include <stdexcept>

namespace GTS {

BoundaryCondition::BoundaryCondition(const Grid& g, const std::vector<int>& faces,
                                     BoundaryType type)
    : types_(g.numFaces(), type == BoundaryType::DIRICHLET ? BoundaryType::NEUMANN
                                                          : BoundaryType::DIRICHLET) {
    for (int f : faces) {
        if (f < 0 || f >= g.numFaces()) {
            throw std::out_of_range("Boundary face index " + std::to_string(f) + " out of range");
        }
        types_[f] = type;
    }
}

std::vector<int> BoundaryCondition::dirichletFaces() const {
    std::vector<int> result;
    for (int f = 0; f < numFaces(); ++f) {
        if (isDirichlet(f)) result.push_back(f);
    }
    return result;
}

BoundaryConditionVectorial::BoundaryConditionVectorial(const Grid& g,
                                                       const std::vector<int>& faces,
                                                       BoundaryType type) {
    BoundaryType other = type == BoundaryType::DIRICHLET ? BoundaryType::NEUMANN
                                                         : BoundaryType::DIRICHLET;
    types_.assign(g.numFaces(), {other, other, other});
    for (int f : faces) {
        if (f < 0 || f >= g.numFaces()) {
            throw std::out_of_range("Boundary face index " + std::to_string(f) + " out of range");
        }
        types_[f] = {type, type, type};
    }
}

std::vector<int> BoundaryConditionVectorial::dirichletFaces() const {
    std::vector<int> result;
    for (int f = 0; f < numFaces(); ++f) {
        if (isDirichlet(f, 0) && isDirichlet(f, 1) && isDirichlet(f, 2)) result.push_back(f);
    }
    return result;
}

std::vector<int> BoundarySides::indices(const std::vector<bool>& mask) {
    std::vector<int> result;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) result.push_back(static_cast<int>(i));
    }
    return result;
}

BoundarySides domainBoundarySides(const Grid& g, const BoundingBox& box, double tol) {
    const int nf = g.numFaces();
    BoundarySides sides;
    sides.all_faces = g.boundaryFaces();
    sides.east.assign(nf, false);
    sides.west.assign(nf, false);
    sides.north.assign(nf, false);
    sides.south.assign(nf, false);
    sides.top.assign(nf, false);
    sides.bottom.assign(nf, false);

    for (int f : sides.all_faces) {
        const Point3& x = g.faceCenter(f);
        sides.east[f] = x[0] > box.xmax - tol;
        sides.west[f] = x[0] < box.xmin + tol;
        sides.north[f] = x[1] > box.ymax - tol;
        sides.south[f] = x[1] < box.ymin + tol;
        sides.top[f] = x[2] > box.zmax - tol;
        sides.bottom[f] = x[2] < box.zmin + tol;
    }
    return sides;
}

} // namespace GTS
