#ifndef GRID_BUCKET_HPP
#define GRID_BUCKET_HPP

#include "GTS.hpp"
#include "Grid.hpp"
#include "Parameters.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace GTS {

struct UnstructuredMesh;

/**
 * @brief Local frame of a fracture cell for contact mechanics
 */
struct ContactProjection {
    Point3 normal;
    Point3 tangent1;
    Point3 tangent2;
};

/**
 * @brief Data attached to one grid of the hierarchy
 */
struct GridData {
    ParameterMap parameters;                                ///< keyword -> parameters
    std::map<std::string, std::vector<double>> state;       ///< persistent fields
    std::vector<ContactProjection> projections;             ///< fracture grids only
};

/**
 * @brief Interface between a grid and a grid of one dimension lower
 *
 * Each mortar cell pairs one face of the higher-dimensional grid with the
 * lower-dimensional cell occupying it.
 */
struct MortarGrid {
    int primary = -1;           ///< Index of the higher-dimensional grid
    int secondary = -1;         ///< Index of the lower-dimensional grid
    std::vector<std::pair<int, int>> face_cell_pairs;
    ParameterMap parameters;

    int numCells() const { return static_cast<int>(face_cell_pairs.size()); }
};

/**
 * @brief Mixed-dimensional grid hierarchy
 *
 * Grids are stored in insertion order: the matrix first, then fractures in
 * the order of the shear-zone list, then intersection lines.
 */
class GridBucket {
public:
    GridBucket() = default;

    int addGrid(std::shared_ptr<Grid> g);
    int addEdge(MortarGrid edge);

    int numGrids() const { return static_cast<int>(grids_.size()); }
    int numEdges() const { return static_cast<int>(edges_.size()); }

    Grid& grid(int i) { return *grids_.at(i); }
    const Grid& grid(int i) const { return *grids_.at(i); }
    GridData& data(int i) { return data_.at(i); }
    const GridData& data(int i) const { return data_.at(i); }

    MortarGrid& edge(int e) { return edges_.at(e); }
    const MortarGrid& edge(int e) const { return edges_.at(e); }

    int dimMax() const;
    int dimMin() const;
    std::vector<int> gridsOfDimension(int dim) const;

    // Edges whose primary (higher-dimensional) side is grid i
    std::vector<int> edgesOfPrimary(int i) const;
    // Edges whose secondary (lower-dimensional) side is grid i
    std::vector<int> edgesOfSecondary(int i) const;

    // Grid carrying this name, -1 if absent
    int findByName(const std::string& name) const;

    int numCells() const;

private:
    std::vector<std::shared_ptr<Grid>> grids_;
    std::vector<GridData> data_;
    std::vector<MortarGrid> edges_;
};

/**
 * @brief Build the grid hierarchy from a simplex mesh and the shear zones
 *
 * Triangles lying on a shear-zone plane inside its polygon become cells of
 * that zone's 2-D grid (named after the zone); edges shared by two or more
 * zones become 1-D intersection grids, one per set of zones, coupled to each
 * zone of the set. Interfaces are matched by node tags and the
 * coupled faces of each higher-dimensional grid are tagged "fracture_faces".
 *
 * @throws std::runtime_error if the mesh has no tetrahedra, a zone gets no
 *         cells, or a fracture cell is not a face of the matrix grid
 */
std::shared_ptr<GridBucket> buildGridBucket(const UnstructuredMesh& mesh,
                                            const FractureNetwork& network);

// Normal and tangents of every fracture cell
void setProjections(GridBucket& gb);

/**
 * @brief Check the names of the fracture grids against the requested list
 *
 * Count must equal the list size, no duplicates, every name in the list,
 * and (if network is given) each named grid lies on its zone's plane.
 *
 * @throws std::logic_error describing the first violation
 */
void validateFractureNames(const GridBucket& gb, const std::vector<std::string>& names,
                           const FractureNetwork* network = nullptr);

} // namespace GTS

#endif // GRID_BUCKET_HPP
