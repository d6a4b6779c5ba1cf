#ifndef ISC_DATA_HPP
#define ISC_DATA_HPP

#include "GTS.hpp"
#include <map>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Point where a borehole crosses a shear zone
 */
struct IntersectionRecord {
    std::string borehole;
    std::string shearzone;
    Point3 point = {0.0, 0.0, 0.0};
};

/**
 * @brief Borehole / shear-zone intersection table of the ISC site
 *
 * Read from a comma separated file with a header row naming at least the
 * columns borehole, shearzone, x_sz, y_sz and z_sz (any order, extra
 * columns ignored). Lines starting with '#' are comments.
 */
class IntersectionTable {
public:
    IntersectionTable() = default;
    explicit IntersectionTable(std::vector<IntersectionRecord> records);

    static IntersectionTable fromCsv(const std::string& filename);

    void addRecord(const IntersectionRecord& record);

    // All records matching both identifiers
    std::vector<IntersectionRecord> select(const std::string& borehole,
                                           const std::string& shearzone) const;

    // Intersection points of one shear zone with every borehole
    std::vector<Point3> shearzonePoints(const std::string& shearzone) const;

    bool hasShearzone(const std::string& shearzone) const;

    const std::vector<IntersectionRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<IntersectionRecord> records_;
};

/**
 * @brief Resolve a data path that may be an alias name
 *
 * If @p data_path is a key of @p aliases the mapped value is used. The
 * result may be a directory (containing borehole_shearzone_intersections.csv)
 * or the CSV file itself.
 *
 * @throws std::runtime_error if the resolved table file does not exist
 */
std::string resolveIntersectionFile(const std::string& data_path,
                                    const std::map<std::string, std::string>& aliases);

constexpr const char* INTERSECTION_FILE_NAME = "borehole_shearzone_intersections.csv";

} // namespace GTS

#endif // ISC_DATA_HPP
