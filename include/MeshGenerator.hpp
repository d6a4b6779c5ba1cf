#ifndef MESH_GENERATOR_HPP
#define MESH_GENERATOR_HPP

#include "GTS.hpp"
#include "GmshIO.hpp"
#include <memory>
#include <string>

namespace GTS {

/**
 * @brief Produces a tetrahedral mesh of the domain conforming to the shear zones
 *
 * The mesh contains the tetrahedra of the volume plus the triangles on the
 * domain boundary and on the shear-zone planes; lower-dimensional elements
 * are ignored downstream.
 */
class Mesher {
public:
    virtual ~Mesher() = default;

    /**
     * @brief Mesh at a given refinement level
     *
     * @param network    Shear zones and domain
     * @param args       Mesh sizes
     * @param file_stem  Path without extension for the files written
     * @param level      0 for the base mesh, k for the k-th uniform refinement
     */
    virtual std::shared_ptr<UnstructuredMesh> generate(const FractureNetwork& network,
                                                       const MeshArgs& args,
                                                       const std::string& file_stem,
                                                       int level) = 0;

    virtual std::string name() const = 0;

    // File written for a level: <stem>.msh for level 0, <stem>_<k>.msh otherwise
    static std::string meshFileName(const std::string& file_stem, int level);
};

/**
 * @brief Runs the external gmsh executable
 *
 * Level 0 writes <stem>.geo and calls `gmsh -3`; level k refines the mesh
 * of level k-1 with `gmsh -refine`. The resulting MSH 2.2 file is read back
 * with GmshIO. A non-zero exit status or a missing output file raises
 * std::runtime_error; nothing is retried.
 */
class GmshMesher : public Mesher {
public:
    explicit GmshMesher(const std::string& executable = "gmsh");

    std::shared_ptr<UnstructuredMesh> generate(const FractureNetwork& network,
                                               const MeshArgs& args,
                                               const std::string& file_stem,
                                               int level) override;

    std::string name() const override { return "gmsh"; }

    // Run a shell command, throwing on non-zero status
    static void runCommand(const std::string& command);

private:
    std::string executable_;
};

/**
 * @brief Built-in Kuhn tetrahedral mesh of the box
 *
 * Every hexahedron of an nx x ny x nz lattice is split into six tetrahedra
 * sharing its main diagonal, which gives a conforming mesh. Shear zones are
 * resolved only where they coincide with lattice planes. Level k uses
 * 2^k times the cells per axis. The mesh is also written as <stem>.msh.
 */
class StructuredMesher : public Mesher {
public:
    StructuredMesher() = default;

    std::shared_ptr<UnstructuredMesh> generate(const FractureNetwork& network,
                                               const MeshArgs& args,
                                               const std::string& file_stem,
                                               int level) override;

    std::string name() const override { return "structured"; }

    static std::shared_ptr<UnstructuredMesh> kuhnMesh(const FractureNetwork& network,
                                                      const std::array<int, 3>& cells);
};

std::unique_ptr<Mesher> createMesher(const MeshArgs& args);

} // namespace GTS

#endif // MESH_GENERATOR_HPP
