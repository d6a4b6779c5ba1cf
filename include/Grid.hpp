#ifndef GRID_HPP
#define GRID_HPP

#include "GTS.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Simplex grid of dimension 1, 2 or 3 embedded in 3-D
 *
 * Cells are segments, triangles or tetrahedra given by global node tags.
 * Faces (points, edges, triangles) are the unique node subsets of the cells.
 * Every face stores its one or two neighbouring cells; the unit normal
 * points out of the first of them. Face "area" is the triangle area in 3-D,
 * the edge length in 2-D and 1 in 1-D; cell "volume" is the volume, area
 * or length accordingly.
 */
class Grid {
public:
    /**
     * @param dim              Topological dimension (1, 2 or 3)
     * @param cell_node_tags   dim+1 node tags per cell
     * @param node_coords      Coordinates of every referenced node tag
     */
    Grid(int dim, const std::vector<std::vector<int>>& cell_node_tags,
         const std::map<int, Point3>& node_coords);

    int dim() const { return dim_; }
    int numCells() const { return static_cast<int>(cell_nodes_.size()); }
    int numFaces() const { return static_cast<int>(face_nodes_.size()); }
    int numNodes() const { return static_cast<int>(node_tags_.size()); }

    // Cell geometry
    const Point3& cellCenter(int c) const { return cell_centers_[c]; }
    double cellVolume(int c) const { return cell_volumes_[c]; }
    const std::vector<int>& cellNodeTags(int c) const { return cell_nodes_[c]; }

    // (face, sign) pairs; sign +1 if the face normal points out of the cell
    const std::vector<std::pair<int, int>>& cellFaces(int c) const { return cell_faces_[c]; }

    // Face geometry
    const Point3& faceCenter(int f) const { return face_centers_[f]; }
    const Point3& faceNormal(int f) const { return face_normals_[f]; }
    double faceArea(int f) const { return face_areas_[f]; }
    const std::vector<int>& faceNodeTags(int f) const { return face_nodes_[f]; }

    // Neighbouring cells; second entry is -1 on the boundary
    const std::array<int, 2>& faceCells(int f) const { return face_cells_[f]; }
    bool isBoundaryFace(int f) const { return face_cells_[f][1] < 0; }
    std::vector<int> boundaryFaces() const;

    // Face with exactly these node tags (any order), -1 if absent
    int findFace(std::vector<int> node_tags) const;

    // Nodes
    const std::vector<int>& nodeTags() const { return node_tags_; }
    const Point3& nodeCoords(int local) const { return node_coords_[local]; }
    int localNode(int tag) const;

    // Unit normal of a triangle cell (2-D grids only)
    Point3 cellNormal(int c) const;

    // Cell whose centre is closest to p; distance returned through the pointer
    int closestCell(const Point3& p, double* distance = nullptr) const;

    // Per-face or per-cell integer/real tags (fracture_faces, well_cells, ...)
    std::map<std::string, std::vector<double>> tags;

    std::optional<std::string> name;

private:
    void computeFaces();
    void computeGeometry();

    int dim_;
    std::vector<int> node_tags_;
    std::vector<Point3> node_coords_;
    std::map<int, int> node_index_;

    std::vector<std::vector<int>> cell_nodes_;
    std::vector<Point3> cell_centers_;
    std::vector<double> cell_volumes_;
    std::vector<std::vector<std::pair<int, int>>> cell_faces_;

    std::vector<std::vector<int>> face_nodes_;
    std::map<std::vector<int>, int> face_index_;
    std::vector<std::array<int, 2>> face_cells_;
    std::vector<Point3> face_centers_;
    std::vector<Point3> face_normals_;
    std::vector<double> face_areas_;
};

} // namespace GTS

#endif // GRID_HPP
