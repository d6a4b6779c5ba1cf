#include "FractureNetwork.hpp"
#include "IscData.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace GTS {

double ShearZone::dip() const {
    Point3 n = plane.normal;
    if (n[2] < 0.0) n = geom::scale(n, -1.0);
    return std::acos(std::min(1.0, n[2])) * 180.0 / M_PI;
}

double ShearZone::dipDirection() const {
    Point3 n = plane.normal;
    if (n[2] < 0.0) n = geom::scale(n, -1.0);
    // Upward normal points along the dip direction in map view
    double az = std::atan2(n[0], n[1]) * 180.0 / M_PI;
    if (az < 0.0) az += 360.0;
    return az;
}

bool ShearZone::contains(const Point3& x, double tol) const {
    if (std::abs(plane.signedDistance(x)) > tol) return false;
    return geom::insideConvexPolygon(x, polygon, plane.normal, tol);
}

ShearZone FractureNetwork::makeShearZone(const std::string& name, const geom::Plane& plane,
                                         const BoundingBox& box) {
    ShearZone sz;
    sz.name = name;
    sz.plane = plane;
    sz.plane.normal = geom::normalize(plane.normal);
    sz.polygon = geom::clipPlaneToBox(sz.plane, box);
    if (sz.polygon.size() < 3) {
        throw std::domain_error("Shear zone " + name + " does not intersect the domain");
    }
    return sz;
}

FractureNetwork::FractureNetwork(const std::vector<std::string>& names,
                                 const IntersectionTable& table, const BoundingBox& box)
    : box_(box) {
    for (const auto& name : names) {
        if (!table.hasShearzone(name)) {
            throw std::domain_error("Unknown shear zone: " + name);
        }
        auto points = table.shearzonePoints(name);

        geom::Plane plane;
        try {
            plane = geom::fitPlane(points);
        } catch (const std::invalid_argument& e) {
            throw std::domain_error("Shear zone " + name + ": " + e.what());
        }

        zones_.push_back(makeShearZone(name, plane, box));
        zones_.back().num_points = static_cast<int>(points.size());
    }
}

FractureNetwork::FractureNetwork(const std::vector<std::pair<std::string, geom::Plane>>& planes,
                                 const BoundingBox& box)
    : box_(box) {
    for (const auto& np : planes) {
        zones_.push_back(makeShearZone(np.first, np.second, box));
    }
}

std::vector<std::string> FractureNetwork::names() const {
    std::vector<std::string> result;
    for (const auto& z : zones_) result.push_back(z.name);
    return result;
}

int FractureNetwork::findZone(const std::string& name) const {
    for (size_t i = 0; i < zones_.size(); ++i) {
        if (zones_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

double FractureNetwork::tolerance() const {
    return 1e-6 * std::max(1.0, box_.maxExtent());
}

void FractureNetwork::exportToGmsh(const std::string& filename, const MeshArgs& args) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    file << std::setprecision(16);

    file << "// Gmsh geometry file for the ISC shear-zone network\n";
    file << "// Generated by GTS FractureNetwork\n\n";

    file << "SetFactory(\"OpenCASCADE\");\n\n";

    file << "mesh_size_frac = " << args.mesh_size_frac << ";\n";
    file << "mesh_size_min = " << args.mesh_size_min << ";\n";
    file << "mesh_size_bound = " << args.mesh_size_bound << ";\n\n";

    file << "Box(1) = {" << box_.xmin << ", " << box_.ymin << ", " << box_.zmin << ", "
         << box_.xmax - box_.xmin << ", " << box_.ymax - box_.ymin << ", "
         << box_.zmax - box_.zmin << "};\n\n";

    int point_id = 1;
    int line_id = 1;
    int surface_id = 1;

    for (const auto& sz : zones_) {
        file << "// Shear zone " << sz.name << "\n";

        std::vector<int> point_ids;
        for (const auto& v : sz.polygon) {
            file << "Point(" << point_id << ") = {"
                 << v[0] << ", " << v[1] << ", " << v[2] << ", mesh_size_frac};\n";
            point_ids.push_back(point_id++);
        }

        std::vector<int> line_ids;
        for (size_t i = 0; i < point_ids.size(); ++i) {
            int p1 = point_ids[i];
            int p2 = point_ids[(i + 1) % point_ids.size()];
            file << "Line(" << line_id << ") = {" << p1 << ", " << p2 << "};\n";
            line_ids.push_back(line_id++);
        }

        file << "Curve Loop(" << surface_id << ") = {";
        for (size_t i = 0; i < line_ids.size(); ++i) {
            if (i > 0) file << ", ";
            file << line_ids[i];
        }
        file << "};\n";
        file << "Plane Surface(" << surface_id << ") = {" << surface_id << "};\n\n";
        surface_id++;
    }

    if (!zones_.empty()) {
        file << "BooleanFragments{ Volume{1}; Delete; }{ Surface{1:" << zones_.size()
             << "}; Delete; }\n\n";
    }

    // Distance to each plane, evaluated analytically
    int field_id = 1;
    std::vector<int> distance_fields;
    for (const auto& sz : zones_) {
        const Point3& n = sz.plane.normal;
        double d = geom::dot(n, sz.plane.point);
        file << "Field[" << field_id << "] = MathEval;\n";
        file << "Field[" << field_id << "].F = \"Abs(" << n[0] << "*x + " << n[1] << "*y + "
             << n[2] << "*z - (" << d << "))\";\n";
        distance_fields.push_back(field_id++);
    }

    if (!distance_fields.empty()) {
        int min_field = field_id++;
        file << "Field[" << min_field << "] = Min;\n";
        file << "Field[" << min_field << "].FieldsList = {";
        for (size_t i = 0; i < distance_fields.size(); ++i) {
            if (i > 0) file << ", ";
            file << distance_fields[i];
        }
        file << "};\n";

        int threshold = field_id++;
        file << "Field[" << threshold << "] = Threshold;\n";
        file << "Field[" << threshold << "].InField = " << min_field << ";\n";
        file << "Field[" << threshold << "].SizeMin = mesh_size_frac;\n";
        file << "Field[" << threshold << "].SizeMax = mesh_size_bound;\n";
        file << "Field[" << threshold << "].DistMin = mesh_size_frac;\n";
        file << "Field[" << threshold << "].DistMax = mesh_size_bound;\n";
        file << "Background Field = " << threshold << ";\n\n";
    }

    file << "Mesh.MeshSizeMin = mesh_size_min;\n";
    file << "Mesh.MeshSizeMax = mesh_size_bound;\n";
    file << "Mesh.MeshSizeFromPoints = 0;\n";
    file << "Mesh.MeshSizeFromCurvature = 0;\n";
    file << "Mesh.MeshSizeExtendFromBoundary = 0;\n";
    file << "Mesh.SaveAll = 1;\n";
    file << "Mesh.MshFileVersion = 2.2;\n";
}

void FractureNetwork::writeVTK(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "# vtk DataFile Version 3.0\n";
    file << "ISC shear zones\n";
    file << "ASCII\n";
    file << "DATASET POLYDATA\n";

    size_t total_vertices = 0;
    for (const auto& sz : zones_) total_vertices += sz.polygon.size();

    file << "POINTS " << total_vertices << " double\n";
    for (const auto& sz : zones_) {
        for (const auto& v : sz.polygon) {
            file << v[0] << " " << v[1] << " " << v[2] << "\n";
        }
    }

    file << "POLYGONS " << zones_.size() << " " << zones_.size() + total_vertices << "\n";
    size_t vertex_offset = 0;
    for (const auto& sz : zones_) {
        file << sz.polygon.size();
        for (size_t j = 0; j < sz.polygon.size(); ++j) {
            file << " " << (vertex_offset + j);
        }
        file << "\n";
        vertex_offset += sz.polygon.size();
    }

    file << "CELL_DATA " << zones_.size() << "\n";
    file << "SCALARS zone_id int 1\n";
    file << "LOOKUP_TABLE default\n";
    for (size_t i = 0; i < zones_.size(); ++i) {
        file << i << "\n";
    }

    file << "SCALARS dip double 1\n";
    file << "LOOKUP_TABLE default\n";
    for (const auto& sz : zones_) {
        file << sz.dip() << "\n";
    }

    file << "SCALARS dip_direction double 1\n";
    file << "LOOKUP_TABLE default\n";
    for (const auto& sz : zones_) {
        file << sz.dipDirection() << "\n";
    }
}

} // namespace GTS
