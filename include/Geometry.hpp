#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "GTS.hpp"
#include <vector>

namespace GTS {
namespace geom {

// Small fixed-size vector algebra on Point3
Point3 add(const Point3& a, const Point3& b);
Point3 sub(const Point3& a, const Point3& b);
Point3 scale(const Point3& a, double s);
double dot(const Point3& a, const Point3& b);
Point3 cross(const Point3& a, const Point3& b);
double norm(const Point3& a);
double distance(const Point3& a, const Point3& b);
Point3 normalize(const Point3& a);
Point3 centroid(const std::vector<Point3>& points);

Point3 matVec(const Tensor3& m, const Point3& v);
Tensor3 transpose(const Tensor3& m);
Tensor3 matMul(const Tensor3& a, const Tensor3& b);
Tensor3 identity();

/**
 * @brief Eigen-decomposition of a symmetric 3x3 matrix (cyclic Jacobi)
 *
 * @param m        Symmetric input matrix
 * @param values   Eigenvalues in ascending order
 * @param vectors  Matching unit eigenvectors stored as columns
 */
void symmetricEigen(const Tensor3& m, Point3& values, Tensor3& vectors);
Point3 symmetricEigenvalues(const Tensor3& m);

/**
 * @brief Infinite plane through a point with unit normal
 */
struct Plane {
    Point3 point = {0.0, 0.0, 0.0};
    Point3 normal = {0.0, 0.0, 1.0};

    double signedDistance(const Point3& x) const;
};

/**
 * @brief Least-squares plane through a point cloud
 *
 * The normal is the eigenvector of the smallest eigenvalue of the scatter
 * matrix. Throws std::invalid_argument for fewer than three points or for
 * (nearly) collinear points.
 */
Plane fitPlane(const std::vector<Point3>& points);

/**
 * @brief Orthonormal in-plane axes (e1, e2) with e1 x e2 == normal
 */
void planeAxes(const Point3& normal, Point3& e1, Point3& e2);

/**
 * @brief Convex polygon cut out of an axis-aligned box by a plane
 *
 * Vertices are the intersections of the plane with the twelve box edges,
 * de-duplicated and ordered counter-clockwise about the plane normal.
 * Returns an empty vector if the plane misses the box.
 */
std::vector<Point3> clipPlaneToBox(const Plane& plane, const BoundingBox& box);

/**
 * @brief Point-in-convex-polygon test for a point lying in the polygon plane
 *
 * @param polygon  Vertices ordered counter-clockwise about normal
 * @param tol      Absolute tolerance on the distance to each edge
 */
bool insideConvexPolygon(const Point3& x, const std::vector<Point3>& polygon,
                         const Point3& normal, double tol);

double polygonArea(const std::vector<Point3>& polygon);

double triangleArea(const Point3& a, const Point3& b, const Point3& c);
double tetraVolume(const Point3& a, const Point3& b, const Point3& c, const Point3& d);

} // namespace geom
} // namespace GTS

#endif // GEOMETRY_HPP
