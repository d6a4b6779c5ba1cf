/**
 * @file test_fixtures.hpp
 * @brief Small domains and data shared by the GTS test suites
 */

#ifndef GTS_TEST_FIXTURES_HPP
#define GTS_TEST_FIXTURES_HPP

#include "GTS.hpp"
#include "FractureNetwork.hpp"
#include "Geometry.hpp"
#include "IscData.hpp"
#include <filesystem>
#include <fstream>
#include <string>

namespace GTS {
namespace testing {

// [0, n]^3 box
inline BoundingBox cubeBox(double n = 2.0) {
    BoundingBox box;
    box.xmin = 0.0; box.xmax = n;
    box.ymin = 0.0; box.ymax = n;
    box.zmin = 0.0; box.zmax = n;
    return box;
}

inline geom::Plane horizontalPlane(double z) {
    geom::Plane plane;
    plane.point = {0.0, 0.0, z};
    plane.normal = {0.0, 0.0, 1.0};
    return plane;
}

inline geom::Plane verticalPlaneX(double x) {
    geom::Plane plane;
    plane.point = {x, 0.0, 0.0};
    plane.normal = {1.0, 0.0, 0.0};
    return plane;
}

/**
 * @brief Intersection table of two shear zones in the unit-spaced cube [0, 2]^3
 *
 * S1_2 is the plane z = 1 and S3_1 the plane x = 1; both lie on lattice
 * planes of a 2x2x2 structured mesh. INJ1 crosses S1_2 once.
 */
inline IntersectionTable latticeTable() {
    IntersectionTable table;
    table.addRecord({"INJ1", "S1_2", {0.6, 0.6, 1.0}});
    table.addRecord({"INJ2", "S1_2", {1.5, 0.5, 1.0}});
    table.addRecord({"PRP1", "S1_2", {0.5, 1.5, 1.0}});
    table.addRecord({"INJ1", "S3_1", {1.0, 0.5, 0.5}});
    table.addRecord({"INJ2", "S3_1", {1.0, 1.5, 0.5}});
    table.addRecord({"PRP1", "S3_1", {1.0, 0.5, 1.5}});
    return table;
}

inline void writeTableCsv(const IntersectionTable& table, const std::string& path) {
    std::ofstream out(path);
    out << "borehole,shearzone,x_sz,y_sz,z_sz\n";
    for (const auto& r : table.records()) {
        out << r.borehole << "," << r.shearzone << "," << r.point[0] << "," << r.point[1]
            << "," << r.point[2] << "\n";
    }
}

// Fresh scratch directory below the working directory
inline std::string scratchFolder(const std::string& name) {
    std::filesystem::path p = std::filesystem::current_path() / ("gts_test_" + name);
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p.string();
}

/**
 * @brief Structured-mesh run of S1_2 in [0, 2]^3 writing into folder
 *
 * The intersection table is written to folder/intersections.csv. Unit
 * scales and a unit time step give end_time = num_steps - 1.
 */
inline SimulationConfig latticeConfig(const std::string& folder, int num_steps = 3) {
    const std::string csv = folder + "/intersections.csv";
    writeTableCsv(latticeTable(), csv);

    SimulationConfig config;
    config.mesh_args.mesher = MesherType::STRUCTURED;
    config.mesh_args.cells = {2, 2, 2};
    config.box = cubeBox(2.0);
    config.shearzone_names = {"S1_2"};
    config.data_path = csv;
    config.output.viz_folder = folder + "/viz";
    config.output.file_name = "lattice";
    config.time.num_steps = num_steps;
    return config;
}

} // namespace testing
} // namespace GTS

#endif // GTS_TEST_FIXTURES_HPP
