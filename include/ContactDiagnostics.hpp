#ifndef CONTACT_DIAGNOSTICS_HPP
#define CONTACT_DIAGNOSTICS_HPP

#include "GTS.hpp"

namespace GTS {

/**
 * @brief Resolved stress on a plane
 *
 * Compression is negative in the stress tensor and positive in
 * effective_normal.
 */
struct ContactStress {
    double normal = 0.0;             ///< n . sigma n
    double effective_normal = 0.0;   ///< -n . sigma n - p
    double shear = 0.0;              ///< |sigma n - (n . sigma n) n|
    double slip_tendency = 0.0;      ///< shear / effective_normal
    double coulomb = 0.0;            ///< shear - mu effective_normal
};

/**
 * @brief Coulomb analysis of a plane with unit normal n
 *
 * If the effective normal stress is not compressive the slip tendency is
 * reported as the largest finite double.
 */
ContactStress resolveStress(const Tensor3& sigma, const Point3& n, double pressure,
                            double friction);

/**
 * @brief Slip tendency and Coulomb function of every fracture cell
 *
 * Uses the contact projections, the fracture pressure (state "p", rescaled
 * by scalar_scale to Pa) and the mechanics friction_coefficient. Results
 * go to the state fields "slip_tendency" and "coulomb_stress".
 *
 * @return Largest slip tendency over all fracture cells
 */
double evaluateSlipTendency(GridBucket& gb, const Tensor3& sigma, double scalar_scale);

} // namespace GTS

#endif // CONTACT_DIAGNOSTICS_HPP
