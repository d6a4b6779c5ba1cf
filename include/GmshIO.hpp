#ifndef GMSH_IO_HPP
#define GMSH_IO_HPP

#include "GTS.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <array>

namespace GTS {

struct MeshNode {
    int tag;
    double x, y, z;

    MeshNode() : tag(0), x(0), y(0), z(0) {}
    MeshNode(int t, double xx, double yy, double zz) : tag(t), x(xx), y(yy), z(zz) {}

    Point3 coords() const { return {x, y, z}; }
};

/**
 * @brief Simplex element types of the Gmsh MSH format (values are the MSH ids)
 *
 * Anything else in a file (quadrangles, hexahedra, second order elements)
 * is skipped on reading.
 */
enum class GmshElementType {
    UNKNOWN = 0,
    LINE = 1,
    TRIANGLE = 2,
    TETRAHEDRON = 4,
    POINT = 15
};

struct MeshElement {
    int tag;
    GmshElementType type;
    int physical_tag;              ///< Physical group (v2) or entity tag (v4)
    int geometrical_tag;           ///< Elementary entity tag
    std::vector<int> node_tags;    ///< dim + 1 node tags

    MeshElement() : tag(0), type(GmshElementType::UNKNOWN), physical_tag(0), geometrical_tag(0) {}
    MeshElement(int t, GmshElementType ty, std::vector<int> nodes, int entity = 0)
        : tag(t), type(ty), physical_tag(entity), geometrical_tag(entity),
          node_tags(std::move(nodes)) {}

    int getNumNodes() const;
    int getDimension() const;
};

struct PhysicalGroup {
    int tag = 0;
    int dimension = 0;
    std::string name;
};

/**
 * @brief Simplex mesh of the domain and the shear-zone surfaces
 */
struct UnstructuredMesh {
    std::vector<MeshNode> nodes;
    std::vector<MeshElement> elements;
    std::map<int, PhysicalGroup> physical_groups;

    int dimension = 3;                  ///< Highest element dimension
    std::array<double, 3> bbox_min = {0.0, 0.0, 0.0};
    std::array<double, 3> bbox_max = {0.0, 0.0, 0.0};

    int getNumNodes() const { return static_cast<int>(nodes.size()); }
    int getNumElements() const { return static_cast<int>(elements.size()); }
    int getNumCells() const;            ///< Elements of the mesh dimension

    std::vector<int> elementsOfType(GmshElementType type) const;
    std::map<int, Point3> nodeCoordinates() const;

    void computeBoundingBox();
};

/**
 * @brief Reads ASCII MSH 2.2 / 4.x meshes and writes ASCII MSH 2.2
 *
 * Errors do not throw: readMshFile() and writeMshFile() return false and
 * lastError() names the file and, when reading, the offending line.
 *
 * @code
 * GmshIO gmsh;
 * if (!gmsh.readMshFile("gmsh_frac_file.msh")) {
 *     throw std::runtime_error(gmsh.lastError());
 * }
 * auto mesh = gmsh.getMesh();
 * @endcode
 */
class GmshIO {
public:
    GmshIO() = default;

    bool readMshFile(const std::string& filename);
    bool writeMshFile(const std::string& filename) const;

    std::shared_ptr<UnstructuredMesh> getMesh() const { return mesh_; }
    void setMesh(std::shared_ptr<UnstructuredMesh> mesh) { mesh_ = std::move(mesh); }

    const std::string& getFormatVersion() const { return format_version_; }
    const std::string& lastError() const { return last_error_; }

    // Elements of unsupported types dropped by the last read
    int skippedElements() const { return skipped_elements_; }

    static int getNumNodesForElementType(GmshElementType type);
    static GmshElementType intToElementType(int type_id);

private:
    std::shared_ptr<UnstructuredMesh> mesh_;
    std::string format_version_;
    int skipped_elements_ = 0;
    mutable std::string last_error_;
};

} // namespace GTS

#endif // GMSH_IO_HPP
