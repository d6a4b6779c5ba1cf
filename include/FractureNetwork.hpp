#ifndef FRACTURE_NETWORK_HPP
#define FRACTURE_NETWORK_HPP

#include "GTS.hpp"
#include "Geometry.hpp"
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Planar shear zone clipped to the simulation domain
 */
struct ShearZone {
    std::string name;
    geom::Plane plane;                  ///< Fitted plane (unit normal)
    std::vector<Point3> polygon;        ///< Plane-box intersection, CCW about normal
    int num_points = 0;                 ///< Intersection points used in the fit

    double area() const { return geom::polygonArea(polygon); }
    double dip() const;                 ///< Degrees below horizontal
    double dipDirection() const;        ///< Degrees clockwise from north

    // x lies on the plane and inside the polygon
    bool contains(const Point3& x, double tol) const;
};

/**
 * @brief Network of ISC shear zones inside a bounding box
 *
 * Each shear zone is represented by the least-squares plane through its
 * borehole intersection points, cut to the domain. Zones keep the order of
 * the requested name list.
 */
class FractureNetwork {
public:
    FractureNetwork() = default;

    /**
     * @brief Fit the requested shear zones from the intersection table
     *
     * @throws std::domain_error for unknown zones, fewer than three points,
     *         collinear points, or planes missing the box
     */
    FractureNetwork(const std::vector<std::string>& names, const IntersectionTable& table,
                    const BoundingBox& box);

    // Explicit planes (synthetic setups, tests)
    FractureNetwork(const std::vector<std::pair<std::string, geom::Plane>>& planes,
                    const BoundingBox& box);

    size_t size() const { return zones_.size(); }
    bool empty() const { return zones_.empty(); }
    const ShearZone& zone(size_t i) const { return zones_.at(i); }
    const std::vector<ShearZone>& zones() const { return zones_; }
    const BoundingBox& domain() const { return box_; }
    std::vector<std::string> names() const;

    // Index of the named zone, -1 if absent
    int findZone(const std::string& name) const;

    // Absolute tolerance for on-plane tests
    double tolerance() const;

    /**
     * @brief Write a gmsh geometry file (OpenCASCADE kernel)
     *
     * The box volume is fragmented by the shear-zone polygons so that the
     * tetrahedral mesh conforms to every zone; mesh size grows from
     * mesh_size_frac at the zones to mesh_size_bound away from them.
     */
    void exportToGmsh(const std::string& filename, const MeshArgs& args) const;

    // Shear-zone polygons as VTK polydata
    void writeVTK(const std::string& filename) const;

private:
    static ShearZone makeShearZone(const std::string& name, const geom::Plane& plane,
                                   const BoundingBox& box);

    std::vector<ShearZone> zones_;
    BoundingBox box_;
};

} // namespace GTS

#endif // FRACTURE_NETWORK_HPP
