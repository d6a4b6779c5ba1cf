#ifndef GTS_HPP
#define GTS_HPP

#include <petsc.h>
#include <petscksp.h>

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <array>
#include <functional>
#include <utility>

namespace GTS {

// Forward declarations
class Grid;
class GridBucket;
class Logger;
class SimulationContext;
class FractureNetwork;
class IntersectionTable;
class ContactMechanicsBiot;
class IscBiotModel;
class PoroelasticAssembler;
class Exporter;

using Point3 = std::array<double, 3>;
using Tensor3 = std::array<std::array<double, 3>, 3>;

/**
 * @brief Unit constants
 *
 * Everything is stored in SI base units; the constants only make the
 * intent of literal values explicit (e.g. 3 * MILLI * METER^3 per SECOND).
 */
namespace units {
constexpr double PASCAL = 1.0;
constexpr double METER = 1.0;
constexpr double SECOND = 1.0;
constexpr double MILLI = 1.0e-3;
constexpr double KILO = 1.0e3;
constexpr double MEGA = 1.0e6;
constexpr double GIGA = 1.0e9;
constexpr double MINUTE = 60.0 * SECOND;
constexpr double HOUR = 60.0 * MINUTE;
constexpr double DAY = 24.0 * HOUR;
}

/**
 * @brief Keywords of the parameter store and names of state fields
 */
namespace keys {
constexpr const char* MECHANICS = "mechanics";
constexpr const char* FLOW = "flow";
constexpr const char* DISPLACEMENT = "u";
constexpr const char* DISPLACEMENT_EXPORT = "u_";
constexpr const char* PRESSURE = "p";
constexpr const char* WELL = "well";
constexpr const char* WELL_CELLS = "well_cells";
constexpr const char* FRACTURE_FACES = "fracture_faces";
constexpr const char* SLIP_TENDENCY = "slip_tendency";
constexpr const char* COULOMB_STRESS = "coulomb_stress";
}

// Enumerations
enum class MesherType {
    GMSH,           ///< External gmsh executable (.geo -> .msh)
    STRUCTURED      ///< Built-in Kuhn tetrahedral mesh of the box
};

enum class SolverType {
    DIRECT,         ///< KSPPREONLY + LU
    ITERATIVE,      ///< GMRES + ILU
    AMG             ///< GMRES + GAMG
};

enum class DriverMode {
    SINGLE_SHOT,    ///< One linear solve per time step
    NEWTON          ///< Increment-based Newton loop per time step
};

// Configuration structures
struct BoundingBox {
    double xmin = -6.0;
    double xmax = 80.0;
    double ymin = 55.0;
    double ymax = 150.0;
    double zmin = 0.0;
    double zmax = 50.0;

    Point3 lower() const { return {xmin, ymin, zmin}; }
    Point3 upper() const { return {xmax, ymax, zmax}; }
    double maxExtent() const;
    bool contains(const Point3& p, double tol = 0.0) const;
};

struct MeshArgs {
    double mesh_size_frac = 10.0;
    double mesh_size_min = 1.0;
    double mesh_size_bound = 60.0;
    MesherType mesher = MesherType::GMSH;
    std::array<int, 3> cells = {8, 8, 8};    ///< Structured mesher only
    std::string gmsh_executable = "gmsh";
};

struct Scales {
    double scalar_scale = 1.0;
    double length_scale = 1.0;
};

/**
 * @brief Borehole / shear-zone pair selecting the injection point
 */
struct InjectionSite {
    std::string shearzone = "S1_2";
    std::string borehole = "INJ1";
};

struct TimeConfig {
    int num_steps = 2;
    double time_step_factor = 1.0;   ///< time_step = factor * length_scale^2
};

struct NewtonOptions {
    int max_iterations = 10;
    double convergence_tol = 1e-10;
    double divergence_tol = 1e5;
};

struct SolverConfig {
    SolverType type = SolverType::DIRECT;
    double tolerance = 1e-10;
    DriverMode mode = DriverMode::SINGLE_SHOT;
};

struct MaterialConfig {
    double lame_mu = 1.0;                ///< Before division by scalar_scale
    double lame_lambda = 1.0;            ///< Before division by scalar_scale
    double permeability = 1.0;           ///< Before scalar_scale / length_scale^2
    double mass_weight = 1.0;
    double biot_alpha = 1.0;
    double friction_coefficient = 0.5;
    double aperture = 1.0;
};

struct OutputConfig {
    std::string viz_folder = "results/default";
    std::string file_name = "main_run";
    std::string log_file = "results.log";
};

struct SimulationConfig {
    MeshArgs mesh_args;
    BoundingBox box;
    std::vector<std::string> shearzone_names = {"S1_1", "S1_2", "S1_3", "S3_1", "S3_2"};
    InjectionSite injection;
    Scales scales;

    std::string data_path = "default";
    std::map<std::string, std::string> data_aliases;

    OutputConfig output;
    TimeConfig time;
    SolverConfig solver;
    NewtonOptions newton;
    MaterialConfig material;
};

// String conversions used by the configuration reader and the logs
std::string toString(MesherType type);
std::string toString(SolverType type);
std::string toString(DriverMode mode);
MesherType mesherTypeFromString(const std::string& name);
SolverType solverTypeFromString(const std::string& name);
DriverMode driverModeFromString(const std::string& name);

} // namespace GTS

#endif // GTS_HPP
