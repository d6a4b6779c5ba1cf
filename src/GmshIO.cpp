#include "GmshIO.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace GTS {

namespace {

/**
 * Line source over an MSH file. Every read failure throws with the file
 * name and line number attached.
 */
class MshLines {
public:
    MshLines(std::istream& in, const std::string& file) : in_(in), file_(file) {}

    bool next(std::string& line) {
        if (!std::getline(in_, line)) return false;
        ++line_no_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    std::string require(const char* what) {
        std::string line;
        if (!next(line)) fail(std::string("unexpected end of file while reading ") + what);
        return line;
    }

    // Parse a line into the given fields, failing if any is missing
    template <typename... T>
    void fields(const char* what, T&... out) {
        std::istringstream iss(require(what));
        (iss >> ... >> out);
        if (!iss) fail(std::string("malformed ") + what + " line");
    }

    void skipTo(const std::string& end_marker) {
        std::string line;
        while (next(line)) {
            if (line == end_marker) return;
        }
        fail("missing " + end_marker);
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw std::runtime_error("GmshIO: " + file_ + ":" + std::to_string(line_no_) + ": " + message);
    }

private:
    std::istream& in_;
    std::string file_;
    int line_no_ = 0;
};

std::string unquote(std::string s) {
    if (!s.empty() && s.front() == '"') s.erase(0, 1);
    if (!s.empty() && s.back() == '"') s.pop_back();
    return s;
}

void readPhysicalNames(MshLines& lines, UnstructuredMesh& mesh) {
    int count = 0;
    lines.fields("$PhysicalNames count", count);
    for (int i = 0; i < count; ++i) {
        PhysicalGroup group;
        std::string name;
        lines.fields("physical name", group.dimension, group.tag, name);
        group.name = unquote(name);
        mesh.physical_groups[group.tag] = group;
    }
    lines.skipTo("$EndPhysicalNames");
}

void readNodesV2(MshLines& lines, UnstructuredMesh& mesh) {
    int count = 0;
    lines.fields("$Nodes count", count);
    mesh.nodes.reserve(count);
    for (int i = 0; i < count; ++i) {
        MeshNode node;
        lines.fields("node", node.tag, node.x, node.y, node.z);
        mesh.nodes.push_back(node);
    }
    lines.skipTo("$EndNodes");
}

// Node blocks list all tags first, then all coordinates
void readNodesV4(MshLines& lines, UnstructuredMesh& mesh) {
    int blocks = 0, count = 0, min_tag = 0, max_tag = 0;
    lines.fields("$Nodes header", blocks, count, min_tag, max_tag);
    mesh.nodes.reserve(count);
    for (int b = 0; b < blocks; ++b) {
        int entity_dim = 0, entity_tag = 0, parametric = 0, in_block = 0;
        lines.fields("node block header", entity_dim, entity_tag, parametric, in_block);
        if (parametric != 0) lines.fail("parametric node coordinates are not supported");

        const size_t first = mesh.nodes.size();
        for (int i = 0; i < in_block; ++i) {
            MeshNode node;
            lines.fields("node tag", node.tag);
            mesh.nodes.push_back(node);
        }
        for (int i = 0; i < in_block; ++i) {
            MeshNode& node = mesh.nodes[first + i];
            lines.fields("node coordinates", node.x, node.y, node.z);
        }
    }
    lines.skipTo("$EndNodes");
}

int readElementsV2(MshLines& lines, UnstructuredMesh& mesh) {
    int count = 0, skipped = 0;
    lines.fields("$Elements count", count);
    mesh.elements.reserve(count);
    for (int i = 0; i < count; ++i) {
        std::istringstream iss(lines.require("element"));
        int tag = 0, type_id = 0, num_tags = 0;
        iss >> tag >> type_id >> num_tags;

        MeshElement elem;
        elem.tag = tag;
        elem.type = GmshIO::intToElementType(type_id);
        if (elem.type == GmshElementType::UNKNOWN) {
            ++skipped;
            continue;
        }

        // Physical and elementary tag, then optional partition data
        std::vector<int> tags(std::max(num_tags, 0));
        for (int& t : tags) iss >> t;
        if (num_tags >= 1) elem.physical_tag = tags[0];
        if (num_tags >= 2) elem.geometrical_tag = tags[1];

        elem.node_tags.resize(elem.getNumNodes());
        for (int& n : elem.node_tags) iss >> n;
        if (!iss) lines.fail("malformed element line");
        mesh.elements.push_back(std::move(elem));
    }
    lines.skipTo("$EndElements");
    return skipped;
}

int readElementsV4(MshLines& lines, UnstructuredMesh& mesh) {
    int blocks = 0, count = 0, min_tag = 0, max_tag = 0, skipped = 0;
    lines.fields("$Elements header", blocks, count, min_tag, max_tag);
    mesh.elements.reserve(count);
    for (int b = 0; b < blocks; ++b) {
        int entity_dim = 0, entity_tag = 0, type_id = 0, in_block = 0;
        lines.fields("element block header", entity_dim, entity_tag, type_id, in_block);
        const GmshElementType type = GmshIO::intToElementType(type_id);

        for (int i = 0; i < in_block; ++i) {
            std::string line = lines.require("element");
            if (type == GmshElementType::UNKNOWN) {
                ++skipped;
                continue;
            }
            std::istringstream iss(line);
            MeshElement elem(0, type, std::vector<int>(GmshIO::getNumNodesForElementType(type)),
                             entity_tag);
            iss >> elem.tag;
            for (int& n : elem.node_tags) iss >> n;
            if (!iss) lines.fail("malformed element line");
            mesh.elements.push_back(std::move(elem));
        }
    }
    lines.skipTo("$EndElements");
    return skipped;
}

} // namespace

// ============================================================================
// Mesh containers
// ============================================================================

int MeshElement::getNumNodes() const {
    return GmshIO::getNumNodesForElementType(type);
}

int MeshElement::getDimension() const {
    return type == GmshElementType::UNKNOWN ? -1 : getNumNodes() - 1;
}

int UnstructuredMesh::getNumCells() const {
    return static_cast<int>(std::count_if(elements.begin(), elements.end(),
                                          [this](const MeshElement& e) {
                                              return e.getDimension() == dimension;
                                          }));
}

std::vector<int> UnstructuredMesh::elementsOfType(GmshElementType type) const {
    std::vector<int> result;
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].type == type) result.push_back(static_cast<int>(i));
    }
    return result;
}

std::map<int, Point3> UnstructuredMesh::nodeCoordinates() const {
    std::map<int, Point3> coords;
    for (const auto& node : nodes) coords[node.tag] = node.coords();
    return coords;
}

void UnstructuredMesh::computeBoundingBox() {
    if (nodes.empty()) return;
    bbox_min.fill(std::numeric_limits<double>::max());
    bbox_max.fill(std::numeric_limits<double>::lowest());
    for (const auto& node : nodes) {
        const Point3 x = node.coords();
        for (int k = 0; k < 3; ++k) {
            bbox_min[k] = std::min(bbox_min[k], x[k]);
            bbox_max[k] = std::max(bbox_max[k], x[k]);
        }
    }
}

// ============================================================================
// Element types
// ============================================================================

int GmshIO::getNumNodesForElementType(GmshElementType type) {
    switch (type) {
        case GmshElementType::POINT: return 1;
        case GmshElementType::LINE: return 2;
        case GmshElementType::TRIANGLE: return 3;
        case GmshElementType::TETRAHEDRON: return 4;
        default: return 0;
    }
}

GmshElementType GmshIO::intToElementType(int type_id) {
    switch (type_id) {
        case 1: return GmshElementType::LINE;
        case 2: return GmshElementType::TRIANGLE;
        case 4: return GmshElementType::TETRAHEDRON;
        case 15: return GmshElementType::POINT;
        default: return GmshElementType::UNKNOWN;
    }
}

// ============================================================================
// Reading
// ============================================================================

bool GmshIO::readMshFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "GmshIO: Cannot open file: " + filename;
        return false;
    }

    auto mesh = std::make_shared<UnstructuredMesh>();
    format_version_.clear();
    last_error_.clear();
    skipped_elements_ = 0;

    try {
        MshLines lines(file, filename);
        bool have_nodes = false, have_elements = false;
        std::string line;
        while (lines.next(line)) {
            if (line == "$MeshFormat") {
                int file_type = 0, data_size = 0;
                lines.fields("$MeshFormat", format_version_, file_type, data_size);
                if (file_type != 0) lines.fail("binary MSH files are not supported");
                if (format_version_[0] != '2' && format_version_[0] != '4') {
                    lines.fail("unsupported MSH version " + format_version_);
                }
                lines.skipTo("$EndMeshFormat");
            } else if (line == "$PhysicalNames") {
                readPhysicalNames(lines, *mesh);
            } else if (line == "$Nodes" || line == "$Elements") {
                if (format_version_.empty()) lines.fail(line + " before $MeshFormat");
                const bool v4 = format_version_[0] == '4';
                if (line == "$Nodes") {
                    v4 ? readNodesV4(lines, *mesh) : readNodesV2(lines, *mesh);
                    have_nodes = true;
                } else {
                    skipped_elements_ += v4 ? readElementsV4(lines, *mesh)
                                            : readElementsV2(lines, *mesh);
                    have_elements = true;
                }
            } else if (!line.empty() && line[0] == '$' && line.compare(0, 4, "$End") != 0) {
                // $Entities, $Periodic, $NodeData, ...
                lines.skipTo("$End" + line.substr(1));
            }
        }
        if (format_version_.empty()) lines.fail("no $MeshFormat section");
        if (!have_nodes || !have_elements) lines.fail("no $Nodes or $Elements section");
    } catch (const std::runtime_error& e) {
        last_error_ = e.what();
        return false;
    }

    int max_dim = 0;
    for (const auto& elem : mesh->elements) max_dim = std::max(max_dim, elem.getDimension());
    mesh->dimension = max_dim;
    mesh->computeBoundingBox();
    mesh_ = std::move(mesh);
    return true;
}

// ============================================================================
// Writing
// ============================================================================

bool GmshIO::writeMshFile(const std::string& filename) const {
    if (!mesh_ || mesh_->nodes.empty()) {
        last_error_ = "GmshIO: No mesh to write";
        return false;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        last_error_ = "GmshIO: Cannot create file: " + filename;
        return false;
    }
    file << std::setprecision(16);

    file << "$MeshFormat\n2.2 0 8\n$EndMeshFormat\n";

    if (!mesh_->physical_groups.empty()) {
        file << "$PhysicalNames\n" << mesh_->physical_groups.size() << "\n";
        for (const auto& entry : mesh_->physical_groups) {
            const PhysicalGroup& group = entry.second;
            file << group.dimension << " " << group.tag << " \"" << group.name << "\"\n";
        }
        file << "$EndPhysicalNames\n";
    }

    file << "$Nodes\n" << mesh_->nodes.size() << "\n";
    for (const auto& node : mesh_->nodes) {
        file << node.tag << " " << node.x << " " << node.y << " " << node.z << "\n";
    }
    file << "$EndNodes\n";

    file << "$Elements\n" << mesh_->elements.size() << "\n";
    for (const auto& elem : mesh_->elements) {
        file << elem.tag << " " << static_cast<int>(elem.type) << " 2 " << elem.physical_tag
             << " " << elem.geometrical_tag;
        for (int node : elem.node_tags) file << " " << node;
        file << "\n";
    }
    file << "$EndElements\n";

    if (!file) {
        last_error_ = "GmshIO: write failed: " + filename;
        return false;
    }
    return true;
}

} // namespace GTS
