#include "GTS.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GTS {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

double BoundingBox::maxExtent() const {
    return std::max({xmax - xmin, ymax - ymin, zmax - zmin});
}

bool BoundingBox::contains(const Point3& p, double tol) const {
    return p[0] >= xmin - tol && p[0] <= xmax + tol &&
           p[1] >= ymin - tol && p[1] <= ymax + tol &&
           p[2] >= zmin - tol && p[2] <= zmax + tol;
}

std::string toString(MesherType type) {
    switch (type) {
        case MesherType::GMSH: return "gmsh";
        case MesherType::STRUCTURED: return "structured";
    }
    return "unknown";
}

std::string toString(SolverType type) {
    switch (type) {
        case SolverType::DIRECT: return "direct";
        case SolverType::ITERATIVE: return "iterative";
        case SolverType::AMG: return "amg";
    }
    return "unknown";
}

std::string toString(DriverMode mode) {
    switch (mode) {
        case DriverMode::SINGLE_SHOT: return "single_shot";
        case DriverMode::NEWTON: return "newton";
    }
    return "unknown";
}

MesherType mesherTypeFromString(const std::string& name) {
    const std::string n = lower(name);
    if (n == "gmsh") return MesherType::GMSH;
    if (n == "structured") return MesherType::STRUCTURED;
    throw std::invalid_argument("Unknown mesher: " + name);
}

SolverType solverTypeFromString(const std::string& name) {
    const std::string n = lower(name);
    if (n == "direct") return SolverType::DIRECT;
    if (n == "iterative" || n == "gmres") return SolverType::ITERATIVE;
    if (n == "amg" || n == "pyamg" || n == "gamg") return SolverType::AMG;
    throw std::invalid_argument("Unknown solver type: " + name);
}

DriverMode driverModeFromString(const std::string& name) {
    const std::string n = lower(name);
    if (n == "single_shot" || n == "linear") return DriverMode::SINGLE_SHOT;
    if (n == "newton") return DriverMode::NEWTON;
    throw std::invalid_argument("Unknown driver mode: " + name);
}

} // namespace GTS
