#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GTS {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values of the merged file take precedence
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }
    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(val, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("[" + section + "] " + key + ": cannot parse '" +
                                    val + "' as integer");
    }
    if (pos != val.size()) {
        throw std::invalid_argument("[" + section + "] " + key + ": trailing characters in '" +
                                    val + "'");
    }
    return result;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(val, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("[" + section + "] " + key + ": cannot parse '" +
                                    val + "' as double");
    }
    if (pos != val.size()) {
        throw std::invalid_argument("[" + section + "] " + key + ": trailing characters in '" +
                                    val + "'");
    }
    return result;
}

std::vector<int> ConfigReader::getIntArray(const std::string& section,
                                           const std::string& key) const {
    std::vector<int> result;
    for (const auto& token : split(getString(section, key), ',')) {
        try {
            result.push_back(std::stoi(token));
        } catch (const std::exception&) {
            throw std::invalid_argument("[" + section + "] " + key + ": cannot parse '" +
                                        token + "' as integer");
        }
    }
    return result;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Structured parsing
// =============================================================================

void ConfigReader::parseMeshArgs(MeshArgs& args) const {
    args.mesh_size_frac = getDouble("MESH", "mesh_size_frac", args.mesh_size_frac);
    // mesh_size_min and mesh_size_bound follow mesh_size_frac unless given
    args.mesh_size_min = getDouble("MESH", "mesh_size_min", 0.1 * args.mesh_size_frac);
    args.mesh_size_bound = getDouble("MESH", "mesh_size_bound", 6.0 * args.mesh_size_frac);
    args.mesher = mesherTypeFromString(getString("MESH", "mesher", toString(args.mesher)));
    args.gmsh_executable = getString("MESH", "gmsh_executable", args.gmsh_executable);

    if (hasKey("MESH", "cells")) {
        auto cells = getIntArray("MESH", "cells");
        if (cells.size() != 3) {
            throw std::invalid_argument("[MESH] cells: expected three integers");
        }
        args.cells = {cells[0], cells[1], cells[2]};
    }
}

void ConfigReader::parseDomain(BoundingBox& box) const {
    box.xmin = getDouble("DOMAIN", "xmin", box.xmin);
    box.xmax = getDouble("DOMAIN", "xmax", box.xmax);
    box.ymin = getDouble("DOMAIN", "ymin", box.ymin);
    box.ymax = getDouble("DOMAIN", "ymax", box.ymax);
    box.zmin = getDouble("DOMAIN", "zmin", box.zmin);
    box.zmax = getDouble("DOMAIN", "zmax", box.zmax);
}

void ConfigReader::parseDataConfig(SimulationConfig& config) const {
    config.data_path = getString("DATA", "data_path", config.data_path);

    // alias.<name> = <directory>
    const std::string prefix = "alias.";
    for (const auto& key : getKeys("DATA")) {
        if (key.compare(0, prefix.size(), prefix) == 0 && key.size() > prefix.size()) {
            config.data_aliases[key.substr(prefix.size())] = getString("DATA", key);
        }
    }
}

void ConfigReader::parseSolverConfig(SolverConfig& solver, NewtonOptions& newton) const {
    solver.type = solverTypeFromString(getString("SOLVER", "type", toString(solver.type)));
    solver.tolerance = getDouble("SOLVER", "tolerance", solver.tolerance);
    solver.mode = driverModeFromString(getString("SOLVER", "mode", toString(solver.mode)));

    newton.max_iterations = getInt("NEWTON", "max_iterations", newton.max_iterations);
    newton.convergence_tol = getDouble("NEWTON", "convergence_tol", newton.convergence_tol);
    newton.divergence_tol = getDouble("NEWTON", "divergence_tol", newton.divergence_tol);
}

void ConfigReader::parseMaterialConfig(MaterialConfig& material) const {
    material.lame_mu = getDouble("MATERIAL", "lame_mu", material.lame_mu);
    material.lame_lambda = getDouble("MATERIAL", "lame_lambda", material.lame_lambda);
    material.permeability = getDouble("MATERIAL", "permeability", material.permeability);
    material.mass_weight = getDouble("MATERIAL", "mass_weight", material.mass_weight);
    material.biot_alpha = getDouble("MATERIAL", "biot_alpha", material.biot_alpha);
    material.friction_coefficient = getDouble("MATERIAL", "friction_coefficient",
                                              material.friction_coefficient);
    material.aperture = getDouble("MATERIAL", "aperture", material.aperture);
}

void ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    parseMeshArgs(config.mesh_args);
    parseDomain(config.box);

    if (hasKey("SHEARZONES", "names")) {
        config.shearzone_names = getStringArray("SHEARZONES", "names");
    }

    config.injection.shearzone = getString("INJECTION", "shearzone", config.injection.shearzone);
    config.injection.borehole = getString("INJECTION", "borehole", config.injection.borehole);

    config.scales.scalar_scale = getDouble("SCALES", "scalar_scale", config.scales.scalar_scale);
    config.scales.length_scale = getDouble("SCALES", "length_scale", config.scales.length_scale);

    parseDataConfig(config);

    config.output.viz_folder = getString("OUTPUT", "viz_folder", config.output.viz_folder);
    config.output.file_name = getString("OUTPUT", "file_name", config.output.file_name);
    config.output.log_file = getString("OUTPUT", "log_file", config.output.log_file);

    config.time.num_steps = getInt("TIME", "num_steps", config.time.num_steps);
    config.time.time_step_factor = getDouble("TIME", "time_step_factor",
                                             config.time.time_step_factor);

    parseSolverConfig(config.solver, config.newton);
    parseMaterialConfig(config.material);
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    SimulationConfig config;
    try {
        parseSimulationConfig(config);
    } catch (const std::invalid_argument& e) {
        result.valid = false;
        result.errors.push_back(e.what());
        return result;
    }

    const auto& box = config.box;
    if (box.xmax <= box.xmin || box.ymax <= box.ymin || box.zmax <= box.zmin) {
        result.errors.push_back("Invalid [DOMAIN]: every max must exceed its min");
        result.valid = false;
    }
    if (config.mesh_args.mesh_size_frac <= 0.0 || config.mesh_args.mesh_size_min <= 0.0 ||
        config.mesh_args.mesh_size_bound <= 0.0) {
        result.errors.push_back("Mesh sizes must be positive");
        result.valid = false;
    }
    if (config.mesh_args.mesh_size_min > config.mesh_args.mesh_size_frac) {
        result.warnings.push_back("mesh_size_min exceeds mesh_size_frac");
    }
    for (int n : config.mesh_args.cells) {
        if (n < 1) {
            result.errors.push_back("[MESH] cells must be positive");
            result.valid = false;
            break;
        }
    }
    if (config.scales.length_scale <= 0.0 || config.scales.scalar_scale <= 0.0) {
        result.errors.push_back("Scales must be positive");
        result.valid = false;
    }
    if (config.time.num_steps < 1) {
        result.errors.push_back("[TIME] num_steps must be at least 1");
        result.valid = false;
    } else if (config.time.num_steps == 1) {
        result.warnings.push_back("num_steps = 1 gives end_time = 0; no step will be solved");
    }
    if (config.shearzone_names.empty()) {
        result.warnings.push_back("No shear zones listed");
    } else if (std::find(config.shearzone_names.begin(), config.shearzone_names.end(),
                         config.injection.shearzone) == config.shearzone_names.end()) {
        result.errors.push_back("Injection shear zone " + config.injection.shearzone +
                                " is not among the simulated shear zones");
        result.valid = false;
    }
    if (config.newton.max_iterations < 1) {
        result.errors.push_back("[NEWTON] max_iterations must be at least 1");
        result.valid = false;
    }
    return result;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    const SimulationConfig defaults;

    file << "# GTS configuration file: ISC Biot poroelastic simulation\n";
    file << "# All units in SI unless otherwise specified\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[MESH]\n";
    file << "mesh_size_frac = " << defaults.mesh_args.mesh_size_frac << "\n";
    file << "mesh_size_min = " << defaults.mesh_args.mesh_size_min
         << "                  # defaults to 0.1 * mesh_size_frac\n";
    file << "mesh_size_bound = " << defaults.mesh_args.mesh_size_bound
         << "               # defaults to 6 * mesh_size_frac\n";
    file << "mesher = gmsh                       # gmsh or structured\n";
    file << "cells = 8, 8, 8                     # structured mesher only\n";
    file << "gmsh_executable = gmsh\n\n";

    file << "[DOMAIN]\n";
    file << "xmin = " << defaults.box.xmin << "\n";
    file << "xmax = " << defaults.box.xmax << "\n";
    file << "ymin = " << defaults.box.ymin << "\n";
    file << "ymax = " << defaults.box.ymax << "\n";
    file << "zmin = " << defaults.box.zmin << "\n";
    file << "zmax = " << defaults.box.zmax << "\n\n";

    file << "[SHEARZONES]\n";
    file << "names = S1_1, S1_2, S1_3, S3_1, S3_2\n\n";

    file << "[INJECTION]\n";
    file << "shearzone = " << defaults.injection.shearzone << "\n";
    file << "borehole = " << defaults.injection.borehole << "\n\n";

    file << "[SCALES]\n";
    file << "scalar_scale = 1.0\n";
    file << "length_scale = 1.0\n\n";

    file << "[DATA]\n";
    file << "data_path = default                 # directory, CSV file or alias name\n";
    file << "alias.default = data\n\n";

    file << "[OUTPUT]\n";
    file << "viz_folder = " << defaults.output.viz_folder << "\n";
    file << "file_name = " << defaults.output.file_name << "\n";
    file << "log_file = " << defaults.output.log_file << "\n\n";

    file << "[TIME]\n";
    file << "num_steps = " << defaults.time.num_steps << "\n";
    file << "time_step_factor = 1.0              # time_step = factor * length_scale^2\n\n";

    file << "[SOLVER]\n";
    file << "type = direct                       # direct, iterative or amg\n";
    file << "tolerance = " << defaults.solver.tolerance << "\n";
    file << "mode = single_shot                  # single_shot or newton\n\n";

    file << "[NEWTON]\n";
    file << "max_iterations = " << defaults.newton.max_iterations << "\n";
    file << "convergence_tol = " << defaults.newton.convergence_tol << "\n";
    file << "divergence_tol = " << defaults.newton.divergence_tol << "\n\n";

    file << "[MATERIAL]\n";
    file << "lame_mu = 1.0                       # divided by scalar_scale\n";
    file << "lame_lambda = 1.0                   # divided by scalar_scale\n";
    file << "permeability = 1.0                  # times scalar_scale / length_scale^2\n";
    file << "mass_weight = 1.0\n";
    file << "biot_alpha = 1.0\n";
    file << "friction_coefficient = 0.5\n";
    file << "aperture = 1.0\n";
}

} // namespace GTS
