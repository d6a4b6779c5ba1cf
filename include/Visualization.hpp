#ifndef VISUALIZATION_HPP
#define VISUALIZATION_HPP

#include "GTS.hpp"
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief VTU snapshots of a grid bucket plus a PVD time index
 *
 * One unstructured-grid file per grid dimension and step,
 * <file_name>_<dim>_<step>.vtu, holding all grids of that dimension. Cell
 * data are the requested state fields (one or three components; fields a
 * grid does not carry are written as zeros) plus grid_id and dim.
 */
class Exporter {
public:
    struct Entry {
        int step;
        double time;
        int dim;
        std::string file;
    };

    Exporter(const GridBucket& gb, const std::string& file_name, const std::string& folder);

    /**
     * @brief Write the snapshot of every dimension for a step
     * @throws std::runtime_error if a file cannot be written
     */
    void writeVtk(const std::vector<std::string>& fields, int step, double time);

    // <file_name>.pvd listing every snapshot written so far
    void writePvd() const;

    std::string vtuFileName(int dim, int step) const;
    std::string pvdFileName() const;
    const std::string& folder() const { return folder_; }
    const std::vector<Entry>& entries() const { return entries_; }

private:
    void writeDimension(int dim, const std::vector<std::string>& fields,
                        const std::string& path) const;

    const GridBucket& gb_;
    std::string file_name_;
    std::string folder_;
    std::vector<Entry> entries_;
};

} // namespace GTS

#endif // VISUALIZATION_HPP
