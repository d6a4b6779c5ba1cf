#include "WellTagger.hpp"
#include "GridBucket.hpp"
#include "IscData.hpp"
#include "Logger.hpp"
#include <sstream>
#include <stdexcept>

namespace GTS {

WellTag tagWellCells(GridBucket& gb, const IntersectionTable& table, const InjectionSite& site,
                     Logger* logger) {
    const auto rows = table.select(site.borehole, site.shearzone);
    if (rows.empty()) {
        throw std::domain_error("No intersection found.");
    }
    if (rows.size() > 1) {
        throw std::length_error("Should only be one intersection of borehole " + site.borehole +
                                " and shear zone " + site.shearzone + ", found " +
                                std::to_string(rows.size()));
    }
    const Point3& point = rows.front().point;

    WellTag result;
    result.grid = gb.findByName(site.shearzone);
    if (result.grid < 0) {
        throw std::domain_error("No grid named " + site.shearzone + " to place the well in");
    }

    for (int i = 0; i < gb.numGrids(); ++i) {
        Grid& g = gb.grid(i);
        std::vector<double> tags(g.numCells(), 0.0);

        if (i == result.grid) {
            result.cell = g.closestCell(point, &result.distance);
            tags[result.cell] = 1.0;

            if (logger) {
                std::ostringstream oss;
                oss << "Grid of name: " << site.shearzone << ", and dimension " << g.dim();
                logger->info("WellTagger", oss.str());
                logger->info("WellTagger", "Setting non-zero source for scalar variable");
                oss.str("");
                oss.precision(4);
                oss << std::fixed << "Closest cell found has distance: " << result.distance;
                logger->info("WellTagger", oss.str());
            }
        }

        g.tags[keys::WELL_CELLS] = tags;
        gb.data(i).state[keys::WELL] = tags;
    }
    return result;
}

} // namespace GTS
