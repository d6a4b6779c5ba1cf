#include "MeshGenerator.hpp"
#include "FractureNetwork.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace GTS {

std::string Mesher::meshFileName(const std::string& file_stem, int level) {
    if (level == 0) return file_stem + ".msh";
    return file_stem + "_" + std::to_string(level) + ".msh";
}

std::unique_ptr<Mesher> createMesher(const MeshArgs& args) {
    switch (args.mesher) {
        case MesherType::GMSH:
            return std::make_unique<GmshMesher>(args.gmsh_executable);
        case MesherType::STRUCTURED:
            return std::make_unique<StructuredMesher>();
    }
    throw std::invalid_argument("Unknown mesher type");
}

// ============================================================================
// GmshMesher
// ============================================================================

GmshMesher::GmshMesher(const std::string& executable) : executable_(executable) {}

void GmshMesher::runCommand(const std::string& command) {
    int status = std::system(command.c_str());
    if (status != 0) {
        throw std::runtime_error("Command failed with status " + std::to_string(status) +
                                 ": " + command);
    }
}

std::shared_ptr<UnstructuredMesh> GmshMesher::generate(const FractureNetwork& network,
                                                       const MeshArgs& args,
                                                       const std::string& file_stem,
                                                       int level) {
    if (level < 0) {
        throw std::invalid_argument("Refinement level must be non-negative");
    }

    const std::string msh_file = meshFileName(file_stem, level);
    const std::string log_file = file_stem + "_gmsh.log";
    std::filesystem::remove(msh_file);

    std::string command;
    if (level == 0) {
        const std::string geo_file = file_stem + ".geo";
        network.exportToGmsh(geo_file, args);
        command = "\"" + executable_ + "\" -3 \"" + geo_file + "\" -format msh22 -o \"" +
                  msh_file + "\"";
    } else {
        const std::string coarse = meshFileName(file_stem, level - 1);
        if (!std::filesystem::exists(coarse)) {
            generate(network, args, file_stem, level - 1);
        }
        command = "\"" + executable_ + "\" \"" + coarse + "\" -refine -format msh22 -o \"" +
                  msh_file + "\"";
    }
    runCommand(command + " > \"" + log_file + "\" 2>&1");

    if (!std::filesystem::exists(msh_file)) {
        throw std::runtime_error("gmsh did not produce " + msh_file + " (see " + log_file + ")");
    }

    GmshIO io;
    if (!io.readMshFile(msh_file)) {
        throw std::runtime_error(io.lastError());
    }
    return io.getMesh();
}

// ============================================================================
// StructuredMesher
// ============================================================================

std::shared_ptr<UnstructuredMesh> StructuredMesher::kuhnMesh(const FractureNetwork& network,
                                                             const std::array<int, 3>& cells) {
    const int nx = cells[0], ny = cells[1], nz = cells[2];
    if (nx < 1 || ny < 1 || nz < 1) {
        throw std::invalid_argument("Structured mesh needs at least one cell per axis");
    }
    const BoundingBox& box = network.domain();

    auto mesh = std::make_shared<UnstructuredMesh>();
    auto node_tag = [&](int i, int j, int k) {
        return 1 + i + (nx + 1) * (j + (ny + 1) * k);
    };

    mesh->nodes.reserve(static_cast<size_t>(nx + 1) * (ny + 1) * (nz + 1));
    for (int k = 0; k <= nz; ++k) {
        for (int j = 0; j <= ny; ++j) {
            for (int i = 0; i <= nx; ++i) {
                // Snap the last layer to the box so boundary tests are exact
                double x = (i == nx) ? box.xmax : box.xmin + (box.xmax - box.xmin) * i / nx;
                double y = (j == ny) ? box.ymax : box.ymin + (box.ymax - box.ymin) * j / ny;
                double z = (k == nz) ? box.zmax : box.zmin + (box.zmax - box.zmin) * k / nz;
                mesh->nodes.emplace_back(node_tag(i, j, k), x, y, z);
            }
        }
    }

    // Kuhn subdivision: one tetrahedron per permutation of the axes
    static const int permutations[6][3] = {
        {0, 1, 2}, {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}
    };

    int elem_tag = 1;
    std::vector<MeshElement> tets;
    for (int k = 0; k < nz; ++k) {
        for (int j = 0; j < ny; ++j) {
            for (int i = 0; i < nx; ++i) {
                for (const auto& perm : permutations) {
                    std::array<int, 3> idx = {i, j, k};
                    std::vector<int> nodes;
                    nodes.push_back(node_tag(idx[0], idx[1], idx[2]));
                    for (int step = 0; step < 3; ++step) {
                        idx[perm[step]] += 1;
                        nodes.push_back(node_tag(idx[0], idx[1], idx[2]));
                    }
                    tets.emplace_back(elem_tag++, GmshElementType::TETRAHEDRON, nodes, 1);
                }
            }
        }
    }

    // Count tet faces to find the boundary; collect faces on shear-zone planes
    auto coords = mesh->nodeCoordinates();
    std::map<std::array<int, 3>, int> face_count;
    for (const auto& tet : tets) {
        for (int skip = 0; skip < 4; ++skip) {
            std::array<int, 3> face;
            int n = 0;
            for (int v = 0; v < 4; ++v) {
                if (v != skip) face[n++] = tet.node_tags[v];
            }
            std::sort(face.begin(), face.end());
            face_count[face]++;
        }
    }

    const double tol = network.tolerance();
    std::vector<MeshElement> triangles;
    for (const auto& [face, count] : face_count) {
        int entity = 0;
        if (count == 1) {
            entity = 1;
        } else {
            Point3 c = geom::centroid({coords[face[0]], coords[face[1]], coords[face[2]]});
            for (size_t z = 0; z < network.size(); ++z) {
                const ShearZone& sz = network.zone(z);
                bool on_plane = true;
                for (int v : face) {
                    if (std::abs(sz.plane.signedDistance(coords[v])) > tol) on_plane = false;
                }
                if (on_plane && sz.contains(c, tol)) {
                    entity = 10 + static_cast<int>(z);
                    break;
                }
            }
        }
        if (entity != 0) {
            triangles.emplace_back(elem_tag++, GmshElementType::TRIANGLE,
                                   std::vector<int>(face.begin(), face.end()), entity);
        }
    }

    mesh->elements = std::move(triangles);
    mesh->elements.insert(mesh->elements.end(), tets.begin(), tets.end());
    mesh->dimension = 3;
    mesh->computeBoundingBox();
    return mesh;
}

std::shared_ptr<UnstructuredMesh> StructuredMesher::generate(const FractureNetwork& network,
                                                             const MeshArgs& args,
                                                             const std::string& file_stem,
                                                             int level) {
    if (level < 0) {
        throw std::invalid_argument("Refinement level must be non-negative");
    }
    std::array<int, 3> cells = args.cells;
    for (auto& n : cells) n <<= level;

    auto mesh = kuhnMesh(network, cells);

    if (!file_stem.empty()) {
        GmshIO io;
        io.setMesh(mesh);
        const std::string msh_file = meshFileName(file_stem, level);
        if (!io.writeMshFile(msh_file)) {
            throw std::runtime_error(io.lastError());
        }
    }
    return mesh;
}

} // namespace GTS
