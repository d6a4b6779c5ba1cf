#include "Visualization.hpp"
#include "GridBucket.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace GTS {

namespace {

int vtkCellType(int dim) {
    switch (dim) {
        case 3: return 10;   // VTK_TETRA
        case 2: return 5;    // VTK_TRIANGLE
        case 1: return 3;    // VTK_LINE
        default: return 1;   // VTK_VERTEX
    }
}

} // namespace

Exporter::Exporter(const GridBucket& gb, const std::string& file_name, const std::string& folder)
    : gb_(gb), file_name_(file_name), folder_(folder) {
    std::filesystem::create_directories(folder_);
}

std::string Exporter::vtuFileName(int dim, int step) const {
    return file_name_ + "_" + std::to_string(dim) + "_" + std::to_string(step) + ".vtu";
}

std::string Exporter::pvdFileName() const {
    return file_name_ + ".pvd";
}

void Exporter::writeVtk(const std::vector<std::string>& fields, int step, double time) {
    for (int dim = gb_.dimMax(); dim >= gb_.dimMin(); --dim) {
        if (gb_.gridsOfDimension(dim).empty()) continue;
        const std::string name = vtuFileName(dim, step);
        writeDimension(dim, fields, folder_ + "/" + name);
        entries_.push_back({step, time, dim, name});
    }
}

void Exporter::writeDimension(int dim, const std::vector<std::string>& fields,
                              const std::string& path) const {
    const std::vector<int> grids = gb_.gridsOfDimension(dim);

    int num_points = 0;
    int num_cells = 0;
    for (int i : grids) {
        num_points += gb_.grid(i).numNodes();
        num_cells += gb_.grid(i).numCells();
    }

    std::ofstream vtu(path);
    if (!vtu.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    vtu << std::setprecision(12);

    vtu << "<?xml version=\"1.0\"?>\n";
    vtu << "<VTKFile type=\"UnstructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
    vtu << "  <UnstructuredGrid>\n";
    vtu << "    <Piece NumberOfPoints=\"" << num_points << "\" NumberOfCells=\"" << num_cells << "\">\n";

    vtu << "      <Points>\n";
    vtu << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (int i : grids) {
        const Grid& g = gb_.grid(i);
        for (int n = 0; n < g.numNodes(); ++n) {
            const Point3& x = g.nodeCoords(n);
            vtu << "          " << x[0] << " " << x[1] << " " << x[2] << "\n";
        }
    }
    vtu << "        </DataArray>\n";
    vtu << "      </Points>\n";

    vtu << "      <Cells>\n";
    vtu << "        <DataArray type=\"Int64\" Name=\"connectivity\" format=\"ascii\">\n";
    int node_offset = 0;
    for (int i : grids) {
        const Grid& g = gb_.grid(i);
        for (int c = 0; c < g.numCells(); ++c) {
            vtu << "         ";
            for (int tag : g.cellNodeTags(c)) vtu << " " << node_offset + g.localNode(tag);
            vtu << "\n";
        }
        node_offset += g.numNodes();
    }
    vtu << "        </DataArray>\n";
    vtu << "        <DataArray type=\"Int64\" Name=\"offsets\" format=\"ascii\">\n";
    for (int c = 1; c <= num_cells; ++c) {
        vtu << "          " << c * (dim + 1) << "\n";
    }
    vtu << "        </DataArray>\n";
    vtu << "        <DataArray type=\"UInt8\" Name=\"types\" format=\"ascii\">\n";
    for (int c = 0; c < num_cells; ++c) {
        vtu << "          " << vtkCellType(dim) << "\n";
    }
    vtu << "        </DataArray>\n";
    vtu << "      </Cells>\n";

    vtu << "      <CellData>\n";
    for (const auto& field : fields) {
        // Three components if any grid of this dimension stores a vector field
        int components = 1;
        for (int i : grids) {
            auto it = gb_.data(i).state.find(field);
            const int nc = gb_.grid(i).numCells();
            if (it != gb_.data(i).state.end() && nc > 0 &&
                it->second.size() == static_cast<size_t>(3 * nc)) {
                components = 3;
            }
        }

        vtu << "        <DataArray type=\"Float64\" Name=\"" << field
            << "\" NumberOfComponents=\"" << components << "\" format=\"ascii\">\n";
        for (int i : grids) {
            const int nc = gb_.grid(i).numCells();
            auto it = gb_.data(i).state.find(field);
            const bool present = it != gb_.data(i).state.end() &&
                                 it->second.size() == static_cast<size_t>(components * nc);
            for (int c = 0; c < nc; ++c) {
                vtu << "         ";
                for (int k = 0; k < components; ++k) {
                    vtu << " " << (present ? it->second[components * c + k] : 0.0);
                }
                vtu << "\n";
            }
        }
        vtu << "        </DataArray>\n";
    }

    vtu << "        <DataArray type=\"Int32\" Name=\"grid_id\" format=\"ascii\">\n";
    for (int i : grids) {
        for (int c = 0; c < gb_.grid(i).numCells(); ++c) vtu << "          " << i << "\n";
    }
    vtu << "        </DataArray>\n";
    vtu << "        <DataArray type=\"Int32\" Name=\"dim\" format=\"ascii\">\n";
    for (int c = 0; c < num_cells; ++c) vtu << "          " << dim << "\n";
    vtu << "        </DataArray>\n";
    vtu << "      </CellData>\n";

    vtu << "    </Piece>\n";
    vtu << "  </UnstructuredGrid>\n";
    vtu << "</VTKFile>\n";

    if (!vtu.good()) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}

void Exporter::writePvd() const {
    const std::string full_path = folder_ + "/" + pvdFileName();
    std::ofstream pvd(full_path);
    if (!pvd.is_open()) {
        throw std::runtime_error("Cannot open file: " + full_path);
    }

    pvd << "<?xml version=\"1.0\"?>\n";
    pvd << "<VTKFile type=\"Collection\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
    pvd << "  <Collection>\n";

    for (const auto& e : entries_) {
        pvd << "    <DataSet timestep=\"" << e.time << "\" part=\"" << gb_.dimMax() - e.dim
            << "\" file=\"" << e.file << "\"/>\n";
    }

    pvd << "  </Collection>\n";
    pvd << "</VTKFile>\n";

    if (!pvd.good()) {
        throw std::runtime_error("Failed writing file: " + full_path);
    }
}

} // namespace GTS
