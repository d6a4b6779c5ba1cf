#include "StressTensor.hpp"
#include "Geometry.hpp"
#include <cmath>
#include <stdexcept>

namespace GTS {

Point3 principalDirection(double dip, double dip_direction) {
    const double rad = M_PI / 180.0;
    return {std::cos(dip * rad) * std::sin(dip_direction * rad),
            std::cos(dip * rad) * std::cos(dip_direction * rad),
            -std::sin(dip * rad)};
}

Tensor3 orthonormalizeColumns(const Tensor3& m) {
    Point3 cols[3];
    for (int k = 0; k < 3; ++k) cols[k] = {m[0][k], m[1][k], m[2][k]};

    for (int k = 0; k < 3; ++k) {
        for (int j = 0; j < k; ++j) {
            cols[k] = geom::sub(cols[k], geom::scale(cols[j], geom::dot(cols[j], cols[k])));
        }
        if (geom::norm(cols[k]) < 1e-12) {
            throw std::invalid_argument("Principal directions are linearly dependent");
        }
        cols[k] = geom::normalize(cols[k]);
    }

    Tensor3 q;
    for (int i = 0; i < 3; ++i)
        for (int k = 0; k < 3; ++k)
            q[i][k] = cols[k][i];
    return q;
}

Tensor3 stressTensor(const Point3& magnitudes, const Point3& dips,
                     const Point3& dip_directions) {
    Tensor3 rot;
    for (int k = 0; k < 3; ++k) {
        Point3 r = principalDirection(dips[k], dip_directions[k]);
        for (int i = 0; i < 3; ++i) rot[i][k] = r[i];
    }
    rot = orthonormalizeColumns(rot);

    Tensor3 diag{};
    for (int k = 0; k < 3; ++k) diag[k][k] = -magnitudes[k];

    return geom::matMul(geom::matMul(rot, diag), geom::transpose(rot));
}

Tensor3 iscStressTensor() {
    using namespace units;
    const Point3 magnitudes = {13.1 * MEGA * PASCAL, 9.2 * MEGA * PASCAL, 8.7 * MEGA * PASCAL};
    const Point3 dip_directions = {104.48, 259.05, 3.72};
    const Point3 dips = {39.21, 47.90, 12.89};
    return stressTensor(magnitudes, dips, dip_directions);
}

} // namespace GTS
