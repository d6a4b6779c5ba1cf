#ifndef FIELD_ARRAY_HPP
#define FIELD_ARRAY_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Non-owning rows x cols view of a flat array in column-major order
 *
 * Used to reinterpret the cell-major displacement vector (u0x u0y u0z u1x ...)
 * as a 3 x num_cells matrix whose column c holds the displacement of cell c.
 */
class ColumnMajorArray {
public:
    ColumnMajorArray(std::vector<double>& data, int rows)
        : data_(data), rows_(rows) {
        if (rows <= 0 || data.size() % static_cast<size_t>(rows) != 0) {
            throw std::invalid_argument("Cannot reshape array of size " +
                                        std::to_string(data.size()) + " to " +
                                        std::to_string(rows) + " rows");
        }
    }

    int rows() const { return rows_; }
    int cols() const { return static_cast<int>(data_.size()) / rows_; }

    double& operator()(int r, int c) { return data_[r + rows_ * c]; }
    double operator()(int r, int c) const { return data_[r + rows_ * c]; }

    std::vector<double> column(int c) const {
        return std::vector<double>(data_.begin() + rows_ * c, data_.begin() + rows_ * (c + 1));
    }

private:
    std::vector<double>& data_;
    int rows_;
};

} // namespace GTS

#endif // FIELD_ARRAY_HPP
