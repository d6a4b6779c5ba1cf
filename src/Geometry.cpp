#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace GTS {
namespace geom {

Point3 add(const Point3& a, const Point3& b) {
    return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

Point3 sub(const Point3& a, const Point3& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

Point3 scale(const Point3& a, double s) {
    return {a[0] * s, a[1] * s, a[2] * s};
}

double dot(const Point3& a, const Point3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

Point3 cross(const Point3& a, const Point3& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}

double norm(const Point3& a) {
    return std::sqrt(dot(a, a));
}

double distance(const Point3& a, const Point3& b) {
    return norm(sub(a, b));
}

Point3 normalize(const Point3& a) {
    double n = norm(a);
    if (n <= 0.0) {
        throw std::invalid_argument("Cannot normalize a zero vector");
    }
    return scale(a, 1.0 / n);
}

Point3 centroid(const std::vector<Point3>& points) {
    Point3 c = {0.0, 0.0, 0.0};
    if (points.empty()) return c;
    for (const auto& p : points) c = add(c, p);
    return scale(c, 1.0 / static_cast<double>(points.size()));
}

Point3 matVec(const Tensor3& m, const Point3& v) {
    Point3 r = {0.0, 0.0, 0.0};
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            r[i] += m[i][j] * v[j];
    return r;
}

Tensor3 transpose(const Tensor3& m) {
    Tensor3 t;
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            t[i][j] = m[j][i];
    return t;
}

Tensor3 matMul(const Tensor3& a, const Tensor3& b) {
    Tensor3 c{};
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j) {
            double s = 0.0;
            for (int k = 0; k < 3; ++k) s += a[i][k] * b[k][j];
            c[i][j] = s;
        }
    return c;
}

Tensor3 identity() {
    Tensor3 I{};
    I[0][0] = I[1][1] = I[2][2] = 1.0;
    return I;
}

void symmetricEigen(const Tensor3& m, Point3& values, Tensor3& vectors) {
    Tensor3 a = m;
    vectors = identity();

    double scale_ref = 0.0;
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            scale_ref = std::max(scale_ref, std::abs(a[i][j]));
    if (scale_ref == 0.0) {
        values = {0.0, 0.0, 0.0};
        return;
    }

    const int max_sweeps = 50;
    for (int sweep = 0; sweep < max_sweeps; ++sweep) {
        double off = a[0][1] * a[0][1] + a[0][2] * a[0][2] + a[1][2] * a[1][2];
        if (off <= 1e-30 * scale_ref * scale_ref) break;

        for (int p = 0; p < 2; ++p) {
            for (int q = p + 1; q < 3; ++q) {
                if (std::abs(a[p][q]) <= 1e-300) continue;

                double theta = (a[q][q] - a[p][p]) / (2.0 * a[p][q]);
                double t = (theta >= 0.0 ? 1.0 : -1.0) /
                           (std::abs(theta) + std::sqrt(theta * theta + 1.0));
                double c = 1.0 / std::sqrt(t * t + 1.0);
                double s = t * c;

                // A <- J^T A J
                for (int k = 0; k < 3; ++k) {
                    double akp = a[k][p], akq = a[k][q];
                    a[k][p] = c * akp - s * akq;
                    a[k][q] = s * akp + c * akq;
                }
                for (int k = 0; k < 3; ++k) {
                    double apk = a[p][k], aqk = a[q][k];
                    a[p][k] = c * apk - s * aqk;
                    a[q][k] = s * apk + c * aqk;
                }
                for (int k = 0; k < 3; ++k) {
                    double vkp = vectors[k][p], vkq = vectors[k][q];
                    vectors[k][p] = c * vkp - s * vkq;
                    vectors[k][q] = s * vkp + c * vkq;
                }
            }
        }
    }

    // Sort ascending, permuting eigenvector columns alongside
    std::array<int, 3> order = {0, 1, 2};
    std::sort(order.begin(), order.end(), [&a](int i, int j) { return a[i][i] < a[j][j]; });

    Tensor3 sorted{};
    for (int k = 0; k < 3; ++k) {
        values[k] = a[order[k]][order[k]];
        for (int i = 0; i < 3; ++i) sorted[i][k] = vectors[i][order[k]];
    }
    vectors = sorted;
}

Point3 symmetricEigenvalues(const Tensor3& m) {
    Point3 values;
    Tensor3 vectors;
    symmetricEigen(m, values, vectors);
    return values;
}

double Plane::signedDistance(const Point3& x) const {
    return dot(normal, sub(x, point));
}

Plane fitPlane(const std::vector<Point3>& points) {
    if (points.size() < 3) {
        throw std::invalid_argument("At least three points are needed to fit a plane, got " +
                                    std::to_string(points.size()));
    }

    Plane plane;
    plane.point = centroid(points);

    Tensor3 scatter{};
    for (const auto& p : points) {
        Point3 d = sub(p, plane.point);
        for (int i = 0; i < 3; ++i)
            for (int j = 0; j < 3; ++j)
                scatter[i][j] += d[i] * d[j];
    }

    Point3 values;
    Tensor3 vectors;
    symmetricEigen(scatter, values, vectors);

    // The two largest eigenvalues span the plane; collinear clouds have only one
    if (values[2] <= 0.0 || values[1] <= 1e-12 * values[2]) {
        throw std::invalid_argument("Points are collinear; cannot determine a plane");
    }

    plane.normal = normalize({vectors[0][0], vectors[1][0], vectors[2][0]});
    return plane;
}

void planeAxes(const Point3& normal, Point3& e1, Point3& e2) {
    Point3 n = normalize(normal);
    // Use the coordinate axis least aligned with the normal as a seed
    Point3 seed = {1.0, 0.0, 0.0};
    if (std::abs(n[0]) > std::abs(n[1]) && std::abs(n[0]) > std::abs(n[2])) {
        seed = {0.0, 1.0, 0.0};
    } else if (std::abs(n[1]) >= std::abs(n[0]) && std::abs(n[1]) > std::abs(n[2])) {
        seed = {0.0, 0.0, 1.0};
    }
    e1 = normalize(sub(seed, scale(n, dot(seed, n))));
    e2 = cross(n, e1);
}

std::vector<Point3> clipPlaneToBox(const Plane& plane, const BoundingBox& box) {
    const double tol = 1e-10 * std::max(1.0, box.maxExtent());

    Point3 corners[8];
    for (int k = 0; k < 8; ++k) {
        corners[k] = {(k & 1) ? box.xmax : box.xmin,
                      (k & 2) ? box.ymax : box.ymin,
                      (k & 4) ? box.zmax : box.zmin};
    }
    static const int edges[12][2] = {
        {0, 1}, {2, 3}, {4, 5}, {6, 7},     // along x
        {0, 2}, {1, 3}, {4, 6}, {5, 7},     // along y
        {0, 4}, {1, 5}, {2, 6}, {3, 7}      // along z
    };

    std::vector<Point3> candidates;
    for (const auto& e : edges) {
        const Point3& a = corners[e[0]];
        const Point3& b = corners[e[1]];
        double da = plane.signedDistance(a);
        double db = plane.signedDistance(b);

        if (std::abs(da) <= tol) candidates.push_back(a);
        if (std::abs(db) <= tol) candidates.push_back(b);
        if ((da < -tol && db > tol) || (da > tol && db < -tol)) {
            double s = da / (da - db);
            candidates.push_back(add(a, scale(sub(b, a), s)));
        }
    }

    // Remove duplicates (corners shared by several edges)
    std::vector<Point3> unique;
    for (const auto& p : candidates) {
        bool duplicate = false;
        for (const auto& q : unique) {
            if (distance(p, q) <= 1e3 * tol) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) unique.push_back(p);
    }
    if (unique.size() < 3) return {};

    // Order counter-clockwise about the normal
    Point3 c = centroid(unique);
    Point3 e1, e2;
    planeAxes(plane.normal, e1, e2);
    std::sort(unique.begin(), unique.end(), [&](const Point3& p, const Point3& q) {
        Point3 dp = sub(p, c), dq = sub(q, c);
        return std::atan2(dot(dp, e2), dot(dp, e1)) < std::atan2(dot(dq, e2), dot(dq, e1));
    });
    return unique;
}

bool insideConvexPolygon(const Point3& x, const std::vector<Point3>& polygon,
                         const Point3& normal, double tol) {
    const size_t n = polygon.size();
    if (n < 3) return false;
    for (size_t i = 0; i < n; ++i) {
        const Point3& a = polygon[i];
        const Point3& b = polygon[(i + 1) % n];
        Point3 edge = sub(b, a);
        double len = norm(edge);
        if (len == 0.0) continue;
        // Signed in-plane distance of x to the edge line, positive inside
        double d = dot(cross(edge, sub(x, a)), normal) / len;
        if (d < -tol) return false;
    }
    return true;
}

double polygonArea(const std::vector<Point3>& polygon) {
    if (polygon.size() < 3) return 0.0;
    Point3 sum = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < polygon.size(); ++i) {
        sum = add(sum, cross(polygon[i], polygon[(i + 1) % polygon.size()]));
    }
    return 0.5 * norm(sum);
}

double triangleArea(const Point3& a, const Point3& b, const Point3& c) {
    return 0.5 * norm(cross(sub(b, a), sub(c, a)));
}

double tetraVolume(const Point3& a, const Point3& b, const Point3& c, const Point3& d) {
    return std::abs(dot(sub(b, a), cross(sub(c, a), sub(d, a)))) / 6.0;
}

} // namespace geom
} // namespace GTS
