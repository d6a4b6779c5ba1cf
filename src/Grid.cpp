#include "Grid.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace GTS {

Grid::Grid(int dim, const std::vector<std::vector<int>>& cell_node_tags,
           const std::map<int, Point3>& node_coords)
    : dim_(dim), cell_nodes_(cell_node_tags) {
    if (dim < 1 || dim > 3) {
        throw std::invalid_argument("Grid dimension must be 1, 2 or 3, got " +
                                    std::to_string(dim));
    }

    std::set<int> used;
    for (const auto& cell : cell_nodes_) {
        if (static_cast<int>(cell.size()) != dim + 1) {
            throw std::invalid_argument("A " + std::to_string(dim) + "-D simplex needs " +
                                        std::to_string(dim + 1) + " nodes");
        }
        used.insert(cell.begin(), cell.end());
    }

    for (int tag : used) {
        auto it = node_coords.find(tag);
        if (it == node_coords.end()) {
            throw std::invalid_argument("Missing coordinates for node " + std::to_string(tag));
        }
        node_index_[tag] = static_cast<int>(node_tags_.size());
        node_tags_.push_back(tag);
        node_coords_.push_back(it->second);
    }

    computeFaces();
    computeGeometry();
}

void Grid::computeFaces() {
    cell_faces_.assign(cell_nodes_.size(), {});

    for (size_t c = 0; c < cell_nodes_.size(); ++c) {
        const auto& nodes = cell_nodes_[c];
        for (size_t skip = 0; skip < nodes.size(); ++skip) {
            std::vector<int> face;
            for (size_t v = 0; v < nodes.size(); ++v) {
                if (v != skip) face.push_back(nodes[v]);
            }
            std::sort(face.begin(), face.end());

            auto it = face_index_.find(face);
            int f;
            if (it == face_index_.end()) {
                f = static_cast<int>(face_nodes_.size());
                face_index_[face] = f;
                face_nodes_.push_back(face);
                face_cells_.push_back({static_cast<int>(c), -1});
                cell_faces_[c].emplace_back(f, 1);
            } else {
                f = it->second;
                if (face_cells_[f][1] >= 0) {
                    throw std::runtime_error("Non-manifold grid: face shared by more than two cells");
                }
                face_cells_[f][1] = static_cast<int>(c);
                cell_faces_[c].emplace_back(f, -1);
            }
        }
    }
}

void Grid::computeGeometry() {
    const int nc = numCells();
    const int nf = numFaces();

    cell_centers_.resize(nc);
    cell_volumes_.resize(nc);
    for (int c = 0; c < nc; ++c) {
        std::vector<Point3> pts;
        for (int tag : cell_nodes_[c]) pts.push_back(node_coords_[node_index_.at(tag)]);
        cell_centers_[c] = geom::centroid(pts);

        switch (dim_) {
            case 1: cell_volumes_[c] = geom::distance(pts[0], pts[1]); break;
            case 2: cell_volumes_[c] = geom::triangleArea(pts[0], pts[1], pts[2]); break;
            default: cell_volumes_[c] = geom::tetraVolume(pts[0], pts[1], pts[2], pts[3]); break;
        }
        if (cell_volumes_[c] <= 0.0) {
            throw std::runtime_error("Degenerate cell " + std::to_string(c) + " in " +
                                     std::to_string(dim_) + "-D grid");
        }
    }

    face_centers_.resize(nf);
    face_normals_.resize(nf);
    face_areas_.resize(nf);
    for (int f = 0; f < nf; ++f) {
        std::vector<Point3> pts;
        for (int tag : face_nodes_[f]) pts.push_back(node_coords_[node_index_.at(tag)]);
        face_centers_[f] = geom::centroid(pts);

        const Point3 outward = geom::sub(face_centers_[f], cell_centers_[face_cells_[f][0]]);
        Point3 n;
        switch (dim_) {
            case 1:
                face_areas_[f] = 1.0;
                n = geom::normalize(outward);
                break;
            case 2: {
                Point3 t = geom::sub(pts[1], pts[0]);
                face_areas_[f] = geom::norm(t);
                t = geom::scale(t, 1.0 / face_areas_[f]);
                // In-plane normal: remove the tangential part of the outward vector
                n = geom::normalize(geom::sub(outward, geom::scale(t, geom::dot(outward, t))));
                break;
            }
            default: {
                Point3 cr = geom::cross(geom::sub(pts[1], pts[0]), geom::sub(pts[2], pts[0]));
                face_areas_[f] = 0.5 * geom::norm(cr);
                n = geom::normalize(cr);
                if (geom::dot(n, outward) < 0.0) n = geom::scale(n, -1.0);
                break;
            }
        }
        face_normals_[f] = n;
    }
}

std::vector<int> Grid::boundaryFaces() const {
    std::vector<int> result;
    for (int f = 0; f < numFaces(); ++f) {
        if (isBoundaryFace(f)) result.push_back(f);
    }
    return result;
}

int Grid::findFace(std::vector<int> node_tags) const {
    std::sort(node_tags.begin(), node_tags.end());
    auto it = face_index_.find(node_tags);
    return it == face_index_.end() ? -1 : it->second;
}

int Grid::localNode(int tag) const {
    auto it = node_index_.find(tag);
    return it == node_index_.end() ? -1 : it->second;
}

Point3 Grid::cellNormal(int c) const {
    if (dim_ != 2) {
        throw std::logic_error("cellNormal is defined for 2-D grids only");
    }
    const auto& nodes = cell_nodes_[c];
    const Point3& a = node_coords_[node_index_.at(nodes[0])];
    const Point3& b = node_coords_[node_index_.at(nodes[1])];
    const Point3& d = node_coords_[node_index_.at(nodes[2])];
    return geom::normalize(geom::cross(geom::sub(b, a), geom::sub(d, a)));
}

int Grid::closestCell(const Point3& p, double* distance) const {
    int best = -1;
    double best_dist = std::numeric_limits<double>::max();
    for (int c = 0; c < numCells(); ++c) {
        double d = geom::distance(p, cell_centers_[c]);
        if (d < best_dist) {
            best_dist = d;
            best = c;
        }
    }
    if (distance) *distance = best_dist;
    return best;
}

} // namespace GTS
