#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "GTS.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace GTS {

/**
 * @brief INI-style configuration reader
 *
 * Drives a complete ISC run from a single text file:
 *
 * @code
 * [MESH]
 * mesh_size_frac = 10.0
 * mesher = gmsh
 *
 * [SHEARZONES]
 * names = S1_1, S1_2, S1_3, S3_1, S3_2
 * @endcode
 *
 * Missing keys fall back to the defaults of SimulationConfig. Values that
 * are present but cannot be parsed raise std::invalid_argument.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Override values with a second file
    bool mergeFile(const std::string& filename);

    // Raw value accessors
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    std::vector<int> getIntArray(const std::string& section,
                                 const std::string& key) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // Structured parsing into the simulation configuration
    void parseSimulationConfig(SimulationConfig& config) const;
    void parseMeshArgs(MeshArgs& args) const;
    void parseDomain(BoundingBox& box) const;
    void parseDataConfig(SimulationConfig& config) const;
    void parseSolverConfig(SolverConfig& solver, NewtonOptions& newton) const;
    void parseMaterialConfig(MaterialConfig& material) const;

    // Check ranges and cross-field consistency
    ValidationResult validate() const;

    // Write an annotated configuration file holding the defaults
    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace GTS

#endif // CONFIG_READER_HPP
