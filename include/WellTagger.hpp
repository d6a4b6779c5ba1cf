#ifndef WELL_TAGGER_HPP
#define WELL_TAGGER_HPP

#include "GTS.hpp"

namespace GTS {

class Logger;

struct WellTag {
    int grid = -1;          ///< Grid holding the tagged cell
    int cell = -1;          ///< Tagged cell
    double distance = 0.0;  ///< Distance from the intersection point to the cell centre
};

/**
 * @brief Tag the injection cell of a borehole / shear-zone intersection
 *
 * The intersection table is filtered by borehole and shear zone. On the grid
 * named after the shear zone, the cell whose centre is closest to the
 * intersection point gets tag 1. Every grid receives a tag array (zeros
 * elsewhere) in tags["well_cells"] and in state "well". Calling it again
 * gives the same tags.
 *
 * @throws std::domain_error if there is no matching row or no grid carries
 *         the shear-zone name
 * @throws std::length_error if more than one row matches
 */
WellTag tagWellCells(GridBucket& gb, const IntersectionTable& table, const InjectionSite& site,
                     Logger* logger = nullptr);

} // namespace GTS

#endif // WELL_TAGGER_HPP
