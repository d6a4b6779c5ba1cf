#include "GridBucket.hpp"
#include "FractureNetwork.hpp"
#include "Geometry.hpp"
#include "GmshIO.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace GTS {

// ============================================================================
// GridBucket
// ============================================================================

int GridBucket::addGrid(std::shared_ptr<Grid> g) {
    if (!g) {
        throw std::invalid_argument("Cannot add a null grid");
    }
    grids_.push_back(std::move(g));
    data_.emplace_back();
    return static_cast<int>(grids_.size()) - 1;
}

int GridBucket::addEdge(MortarGrid edge) {
    if (edge.primary < 0 || edge.primary >= numGrids() ||
        edge.secondary < 0 || edge.secondary >= numGrids()) {
        throw std::out_of_range("Interface refers to an unknown grid");
    }
    if (grids_[edge.primary]->dim() != grids_[edge.secondary]->dim() + 1) {
        throw std::invalid_argument("Interface must couple grids of adjacent dimension");
    }
    edges_.push_back(std::move(edge));
    return static_cast<int>(edges_.size()) - 1;
}

int GridBucket::dimMax() const {
    int d = 0;
    for (const auto& g : grids_) d = std::max(d, g->dim());
    return d;
}

int GridBucket::dimMin() const {
    int d = 3;
    for (const auto& g : grids_) d = std::min(d, g->dim());
    return d;
}

std::vector<int> GridBucket::gridsOfDimension(int dim) const {
    std::vector<int> result;
    for (int i = 0; i < numGrids(); ++i) {
        if (grids_[i]->dim() == dim) result.push_back(i);
    }
    return result;
}

std::vector<int> GridBucket::edgesOfPrimary(int i) const {
    std::vector<int> result;
    for (int e = 0; e < numEdges(); ++e) {
        if (edges_[e].primary == i) result.push_back(e);
    }
    return result;
}

std::vector<int> GridBucket::edgesOfSecondary(int i) const {
    std::vector<int> result;
    for (int e = 0; e < numEdges(); ++e) {
        if (edges_[e].secondary == i) result.push_back(e);
    }
    return result;
}

int GridBucket::findByName(const std::string& name) const {
    for (int i = 0; i < numGrids(); ++i) {
        if (grids_[i]->name && *grids_[i]->name == name) return i;
    }
    return -1;
}

int GridBucket::numCells() const {
    int n = 0;
    for (const auto& g : grids_) n += g->numCells();
    return n;
}

// ============================================================================
// Construction from a mesh
// ============================================================================

namespace {

bool onDomainBoundary(const std::vector<Point3>& pts, const BoundingBox& box, double tol) {
    const double lo[3] = {box.xmin, box.ymin, box.zmin};
    const double hi[3] = {box.xmax, box.ymax, box.zmax};
    for (int axis = 0; axis < 3; ++axis) {
        bool all_lo = true, all_hi = true;
        for (const auto& p : pts) {
            if (std::abs(p[axis] - lo[axis]) > tol) all_lo = false;
            if (std::abs(p[axis] - hi[axis]) > tol) all_hi = false;
        }
        if (all_lo || all_hi) return true;
    }
    return false;
}

MortarGrid matchInterface(GridBucket& gb, int primary, int secondary) {
    MortarGrid mg;
    mg.primary = primary;
    mg.secondary = secondary;

    Grid& high = gb.grid(primary);
    const Grid& low = gb.grid(secondary);
    auto& fracture_faces = high.tags[keys::FRACTURE_FACES];

    for (int c = 0; c < low.numCells(); ++c) {
        int f = high.findFace(low.cellNodeTags(c));
        if (f < 0) {
            throw std::runtime_error("Cell " + std::to_string(c) + " of the " +
                                     std::to_string(low.dim()) + "-D grid " +
                                     low.name.value_or("") +
                                     " is not a face of the " + std::to_string(high.dim()) +
                                     "-D grid; the mesh does not conform to the fractures");
        }
        mg.face_cell_pairs.emplace_back(f, c);
        fracture_faces[f] = 1.0;
    }
    return mg;
}

} // namespace

std::shared_ptr<GridBucket> buildGridBucket(const UnstructuredMesh& mesh,
                                            const FractureNetwork& network) {
    const auto coords = mesh.nodeCoordinates();
    const BoundingBox& box = network.domain();
    const double tol = network.tolerance();

    // Matrix
    std::vector<std::vector<int>> tets;
    for (int idx : mesh.elementsOfType(GmshElementType::TETRAHEDRON)) {
        tets.push_back(mesh.elements[idx].node_tags);
    }
    if (tets.empty()) {
        throw std::runtime_error("Mesh contains no tetrahedra");
    }
    auto matrix = std::make_shared<Grid>(3, tets, coords);

    // Fracture cells: interior triangles on a zone plane inside its polygon
    std::vector<std::vector<std::vector<int>>> zone_cells(network.size());
    std::set<std::vector<int>> seen;
    for (int idx : mesh.elementsOfType(GmshElementType::TRIANGLE)) {
        std::vector<int> tri = mesh.elements[idx].node_tags;
        std::sort(tri.begin(), tri.end());
        if (!seen.insert(tri).second) continue;

        std::vector<Point3> pts;
        for (int tag : tri) pts.push_back(coords.at(tag));
        if (onDomainBoundary(pts, box, tol)) continue;

        const Point3 center = geom::centroid(pts);
        for (size_t z = 0; z < network.size(); ++z) {
            const ShearZone& sz = network.zone(z);
            bool on_plane = std::all_of(pts.begin(), pts.end(), [&](const Point3& p) {
                return std::abs(sz.plane.signedDistance(p)) <= tol;
            });
            if (on_plane && sz.contains(center, tol)) {
                zone_cells[z].push_back(tri);
                break;
            }
        }
    }

    auto gb = std::make_shared<GridBucket>();
    gb->addGrid(matrix);

    std::vector<int> fracture_index(network.size(), -1);
    for (size_t z = 0; z < network.size(); ++z) {
        if (zone_cells[z].empty()) {
            throw std::runtime_error("Shear zone " + network.zone(z).name +
                                     " produced no fracture cells in the mesh");
        }
        auto g = std::make_shared<Grid>(2, zone_cells[z], coords);
        g->name = network.zone(z).name;
        fracture_index[z] = gb->addGrid(g);
    }

    // Intersection lines: edges shared by cells of two or more zones
    std::map<std::vector<int>, std::set<int>> edge_zones;
    for (size_t z = 0; z < network.size(); ++z) {
        for (const auto& tri : zone_cells[z]) {
            for (int skip = 0; skip < 3; ++skip) {
                std::vector<int> edge;
                for (int v = 0; v < 3; ++v) {
                    if (v != skip) edge.push_back(tri[v]);
                }
                edge_zones[edge].insert(static_cast<int>(z));
            }
        }
    }

    // One line grid per set of zones sharing the edge
    std::map<std::vector<int>, std::vector<std::vector<int>>> intersection_cells;
    for (const auto& [edge, zones] : edge_zones) {
        if (zones.size() < 2) continue;
        intersection_cells[std::vector<int>(zones.begin(), zones.end())].push_back(edge);
    }

    std::map<std::vector<int>, int> intersection_index;
    for (const auto& [zones, cells] : intersection_cells) {
        auto line = std::make_shared<Grid>(1, cells, coords);
        intersection_index[zones] = gb->addGrid(line);
    }

    for (int i = 0; i < gb->numGrids(); ++i) {
        gb->grid(i).tags[keys::FRACTURE_FACES].assign(gb->grid(i).numFaces(), 0.0);
    }

    // Interfaces
    for (size_t z = 0; z < network.size(); ++z) {
        gb->addEdge(matchInterface(*gb, 0, fracture_index[z]));
    }
    for (const auto& [zones, line] : intersection_index) {
        for (int z : zones) {
            gb->addEdge(matchInterface(*gb, fracture_index[z], line));
        }
    }

    return gb;
}

void setProjections(GridBucket& gb) {
    const int nd = gb.dimMax();
    for (int i : gb.gridsOfDimension(nd - 1)) {
        const Grid& g = gb.grid(i);
        auto& projections = gb.data(i).projections;
        projections.assign(g.numCells(), ContactProjection());
        if (g.numCells() == 0) continue;

        // Orient all normals consistently with the first cell
        const Point3 reference = g.cellNormal(0);
        for (int c = 0; c < g.numCells(); ++c) {
            Point3 n = g.cellNormal(c);
            if (geom::dot(n, reference) < 0.0) n = geom::scale(n, -1.0);

            Point3 t1 = geom::cross(n, {0.0, 0.0, 1.0});
            if (geom::norm(t1) < 1e-1) t1 = geom::cross(n, {1.0, 0.0, 0.0});
            t1 = geom::normalize(t1);

            projections[c] = {n, t1, geom::cross(n, t1)};
        }
    }
}

void validateFractureNames(const GridBucket& gb, const std::vector<std::string>& names,
                           const FractureNetwork* network) {
    const int nd = gb.dimMax();
    std::set<std::string> found;
    int count = 0;

    for (int i : gb.gridsOfDimension(nd - 1)) {
        const Grid& g = gb.grid(i);
        if (!g.name) {
            throw std::logic_error("Fracture grid " + std::to_string(i) + " has no name");
        }
        const std::string& name = *g.name;
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            throw std::logic_error("Fracture grid name " + name + " is not a requested shear zone");
        }
        if (!found.insert(name).second) {
            throw std::logic_error("Duplicate fracture grid name " + name);
        }
        ++count;

        if (network) {
            int z = network->findZone(name);
            if (z < 0) {
                throw std::logic_error("Shear zone " + name + " is not in the fracture network");
            }
            const ShearZone& sz = network->zone(z);
            for (int c = 0; c < g.numCells(); ++c) {
                if (std::abs(sz.plane.signedDistance(g.cellCenter(c))) > network->tolerance()) {
                    throw std::logic_error("Fracture grid " + name +
                                           " does not lie on the plane of that shear zone");
                }
            }
        }
    }

    if (count != static_cast<int>(names.size())) {
        throw std::logic_error("Expected " + std::to_string(names.size()) +
                               " named fracture grids, found " + std::to_string(count));
    }
}

} // namespace GTS
