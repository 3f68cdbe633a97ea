#include "geometry.h"

Triangle::Triangle(const std::array<Vec3, 3>& vertices, const Surface& surface)
    : vertices_(vertices), surface_(surface)
{
    const Vec3& p0 = vertices_[0];
    plane_.n = (vertices_[1] - p0).cross(vertices_[2] - p0).normalized();
    plane_.d = plane_.n.dot(p0);
}

std::optional<Hit> Triangle::hit(const Ray& ray) const {
    const Vec3& n = plane_.n;

    const double denom = n.dot(ray.d);
    if (denom == 0.0) return std::nullopt; // parallel to the plane

    // Distance along the ray to the plane
    const double t = (plane_.d - n.dot(ray.o)) / denom;
    if (t <= 0.0) return std::nullopt;     // plane behind (or at) the origin

    const Vec3 p = ray.at(t);

    // Same-side test against each edge, using the face normal as reference
    for (int i = 0; i < 3; ++i) {
        const Vec3 edge = vertices_[(i + 1) % 3] - vertices_[i];
        const Vec3 c    = p - vertices_[i];
        if (n.dot(edge.cross(c)) < 0.0) return std::nullopt;
    }

    return Hit{p, t};
}

std::optional<NearestHit> nearest_hit(const std::vector<Triangle>& triangles,
                                      const Ray& ray,
                                      const Triangle* exclude)
{
    std::optional<Hit> best;
    const Triangle* best_tri = nullptr;

    for (const Triangle& tri : triangles) {
        if (&tri == exclude) continue;
        std::optional<Hit> h = tri.hit(ray);
        if (!h) continue;
        if (!best || h->t < best->t) {  // strict: first seen wins ties
            best     = h;
            best_tri = &tri;
        }
    }

    if (!best) return std::nullopt;
    return NearestHit{best->point, best_tri};
}

std::array<Triangle, 2> make_parallelogram(const Vec3& a, const Vec3& b_side,
                                           const Vec3& c_side, const Surface& surface)
{
    const Vec3 b = a + b_side;
    const Vec3 c = a + c_side;
    const Vec3 d = b + c_side;
    return {
        Triangle({a, b, d}, surface),
        Triangle({a, c, d}, surface)
    };
}
