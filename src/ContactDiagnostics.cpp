#include "ContactDiagnostics.hpp"
#include "Geometry.hpp"
#include "GridBucket.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace GTS {

ContactStress resolveStress(const Tensor3& sigma, const Point3& n, double pressure,
                            double friction) {
    ContactStress s;
    const Point3 traction = geom::matVec(sigma, n);
    s.normal = geom::dot(traction, n);
    s.effective_normal = -s.normal - pressure;
    s.shear = geom::norm(geom::sub(traction, geom::scale(n, s.normal)));
    s.slip_tendency = s.effective_normal > 0.0 ? s.shear / s.effective_normal
                                               : std::numeric_limits<double>::max();
    s.coulomb = s.shear - friction * s.effective_normal;
    return s;
}

double evaluateSlipTendency(GridBucket& gb, const Tensor3& sigma, double scalar_scale) {
    double max_slip = 0.0;
    for (int i : gb.gridsOfDimension(gb.dimMax() - 1)) {
        const Grid& g = gb.grid(i);
        GridData& data = gb.data(i);
        const int nc = g.numCells();
        if (static_cast<int>(data.projections.size()) != nc) {
            throw std::logic_error("Contact projections are not set on fracture grid " +
                                   g.name.value_or(std::to_string(i)));
        }

        const auto mech = data.parameters.find(keys::MECHANICS);
        if (mech == data.parameters.end()) {
            throw std::out_of_range("Missing parameter keyword: " + std::string(keys::MECHANICS));
        }
        const auto& friction = mech->second.array("friction_coefficient");
        auto p_it = data.state.find(keys::PRESSURE);
        const bool has_pressure = p_it != data.state.end() &&
                                  static_cast<int>(p_it->second.size()) == nc;

        std::vector<double> slip(nc), coulomb(nc);
        for (int c = 0; c < nc; ++c) {
            const double p = has_pressure ? p_it->second[c] * scalar_scale : 0.0;
            ContactStress s = resolveStress(sigma, data.projections[c].normal, p, friction.at(c));
            slip[c] = s.slip_tendency;
            coulomb[c] = s.coulomb;
            max_slip = std::max(max_slip, s.slip_tendency);
        }
        data.state[keys::SLIP_TENDENCY] = std::move(slip);
        data.state[keys::COULOMB_STRESS] = std::move(coulomb);
    }
    return max_slip;
}

} // namespace GTS
