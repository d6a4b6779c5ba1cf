#ifndef STRESS_TENSOR_HPP
#define STRESS_TENSOR_HPP

#include "GTS.hpp"

namespace GTS {

/**
 * @brief Unit direction vector of a principal stress axis
 *
 * @param dip            Plunge below horizontal [degrees]
 * @param dip_direction  Azimuth clockwise from north (+y) [degrees]
 * @return (cos(dip) sin(dd), cos(dip) cos(dd), -sin(dip)), z positive up
 */
Point3 principalDirection(double dip, double dip_direction);

/**
 * @brief Orthonormalize the columns of a nearly orthogonal matrix
 *
 * Modified Gram-Schmidt on the columns, i.e. the Q factor of a QR
 * factorization. Column signs may differ from other QR algorithms, which
 * does not affect R D R^T.
 */
Tensor3 orthonormalizeColumns(const Tensor3& m);

/**
 * @brief Stress tensor in Cartesian coordinates from principal magnitudes
 *
 * Returns R diag(-magnitudes) R^T, so compressive magnitudes give a
 * tensor with negative eigenvalues.
 *
 * @param magnitudes        Principal stress magnitudes (compression positive) [Pa]
 * @param dips              Dip of each principal axis [degrees]
 * @param dip_directions    Dip direction of each principal axis [degrees]
 */
Tensor3 stressTensor(const Point3& magnitudes, const Point3& dips,
                     const Point3& dip_directions);

/**
 * @brief In-situ stress at the Grimsel ISC site
 *
 * Principal magnitudes 13.1, 9.2 and 8.7 MPa (compressive)
 * with dip directions 104.48, 259.05, 3.72 and dips 39.21, 47.90, 12.89
 * degrees (Krietsch et al. 2019).
 */
Tensor3 iscStressTensor();

} // namespace GTS

#endif // STRESS_TENSOR_HPP
