#include "IscData.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace GTS {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n\"");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        tokens.push_back(trim(item));
    }
    return tokens;
}

} // namespace

IntersectionTable::IntersectionTable(std::vector<IntersectionRecord> records)
    : records_(std::move(records)) {}

IntersectionTable IntersectionTable::fromCsv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::map<std::string, size_t> column;
    std::vector<IntersectionRecord> records;
    std::string line;
    int line_num = 0;
    bool have_header = false;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto tokens = splitCsv(line);

        if (!have_header) {
            for (size_t i = 0; i < tokens.size(); ++i) {
                column[tokens[i]] = i;
            }
            for (const char* required : {"borehole", "shearzone", "x_sz", "y_sz", "z_sz"}) {
                if (column.find(required) == column.end()) {
                    throw std::runtime_error(filename + ": missing column '" + required + "'");
                }
            }
            have_header = true;
            continue;
        }

        size_t needed = 0;
        for (const auto& kv : column) needed = std::max(needed, kv.second + 1);
        if (tokens.size() < needed) {
            throw std::runtime_error(filename + ":" + std::to_string(line_num) +
                                     ": expected " + std::to_string(needed) + " columns");
        }

        IntersectionRecord rec;
        rec.borehole = tokens[column["borehole"]];
        rec.shearzone = tokens[column["shearzone"]];
        const char* coord_columns[3] = {"x_sz", "y_sz", "z_sz"};
        for (int d = 0; d < 3; ++d) {
            const std::string& token = tokens[column[coord_columns[d]]];
            try {
                rec.point[d] = std::stod(token);
            } catch (const std::exception&) {
                throw std::invalid_argument(filename + ":" + std::to_string(line_num) +
                                            ": cannot parse '" + token + "' as coordinate");
            }
        }
        records.push_back(rec);
    }

    if (!have_header) {
        throw std::runtime_error(filename + ": no header row");
    }
    return IntersectionTable(std::move(records));
}

void IntersectionTable::addRecord(const IntersectionRecord& record) {
    records_.push_back(record);
}

std::vector<IntersectionRecord> IntersectionTable::select(const std::string& borehole,
                                                          const std::string& shearzone) const {
    std::vector<IntersectionRecord> result;
    for (const auto& rec : records_) {
        if (rec.borehole == borehole && rec.shearzone == shearzone) {
            result.push_back(rec);
        }
    }
    return result;
}

std::vector<Point3> IntersectionTable::shearzonePoints(const std::string& shearzone) const {
    std::vector<Point3> points;
    for (const auto& rec : records_) {
        if (rec.shearzone == shearzone) points.push_back(rec.point);
    }
    return points;
}

bool IntersectionTable::hasShearzone(const std::string& shearzone) const {
    return std::any_of(records_.begin(), records_.end(),
                       [&](const IntersectionRecord& r) { return r.shearzone == shearzone; });
}

std::string resolveIntersectionFile(const std::string& data_path,
                                    const std::map<std::string, std::string>& aliases) {
    std::string path = data_path;
    auto it = aliases.find(data_path);
    if (it != aliases.end()) {
        path = it->second;
    }

    std::filesystem::path p(path);
    if (std::filesystem::is_directory(p)) {
        p /= INTERSECTION_FILE_NAME;
    }
    if (!std::filesystem::exists(p)) {
        throw std::runtime_error("Intersection table not found: " + p.string() +
                                 " (data_path = " + data_path + ")");
    }
    return p.string();
}

} // namespace GTS
