#pragma once
#include <array>
#include <optional>
#include <vector>
#include "core.h"
#include "surface.h"

/// Plane: { X | n·X = d } with unit normal n.
struct Plane {
    /// Unit normal; its sign follows the owning triangle's winding.
    Vec3   n;
    /// Offset: n·P for any point P on the plane.
    double d{0.0};
};

/// Hit: where a ray meets one triangle.
struct Hit {
    /// World-space hit position.
    Vec3   point;
    /// Ray parameter at the hit (in units of the ray's direction length).
    double t{0.0};
};

/**
 * @brief Flat three-vertex primitive with a precomputed face plane.
 * The plane normal is normalize((v1-v0) × (v2-v0)), so the vertex winding
 * decides which side is the front. Immutable after construction.
 *
 * Zero-area input (collinear or coincident vertices) produces a NaN normal
 * and undefined intersection results; Scene::add rejects such triangles.
 */
class Triangle {
public:
    Triangle(const std::array<Vec3, 3>& vertices, const Surface& surface);

    /**
     * @brief Ray–triangle intersection.
     * Exact comparisons: a ray parallel to the plane (n·d == 0) misses, a plane
     * at or behind the origin (t <= 0) misses, and points on an edge count as
     * inside. Both faces are hit.
     * @param ray Input ray; direction need not be normalized.
     * @return Hit point and distance, or nothing.
     */
    std::optional<Hit> hit(const Ray& ray) const;

    /// Unit face normal.
    const Vec3& normal() const { return plane_.n; }
    const Plane& plane() const { return plane_; }
    const std::array<Vec3, 3>& vertices() const { return vertices_; }
    const Surface& surface() const { return surface_; }

    /**
     * True when the face normal is not finite (zero-area triangle).
     * Only an exactly zero cross product is caught: near-collinear vertices
     * leave a rounding residue that normalizes to an arbitrary finite normal,
     * and such triangles are accepted.
     */
    bool is_degenerate() const { return !plane_.n.is_finite(); }

private:
    std::array<Vec3, 3> vertices_;
    Plane   plane_;
    Surface surface_;
};

/// Result of a nearest-hit search: the point and the triangle it lies on.
struct NearestHit {
    Vec3 point;
    /// Borrowed from the searched collection.
    const Triangle* triangle{nullptr};
};

/**
 * @brief Closest hit over an unordered triangle list (linear scan).
 * @param triangles Triangles to test.
 * @param ray Input ray.
 * @param exclude Triangle skipped by address, or nullptr. Identity only:
 *        a geometrically equal triangle elsewhere in the list is still tested.
 * @return Nearest hit; on equal distances the earlier triangle wins.
 */
std::optional<NearestHit> nearest_hit(const std::vector<Triangle>& triangles,
                                      const Ray& ray,
                                      const Triangle* exclude = nullptr);

/**
 * @brief Split the parallelogram spanned at a by two sides into two triangles.
 * @param a Corner point.
 * @param b_side First side vector from a.
 * @param c_side Second side vector from a.
 * @param surface Surface shared by both halves.
 * @return { [a, a+b, a+b+c], [a, a+c, a+b+c] }.
 */
std::array<Triangle, 2> make_parallelogram(const Vec3& a, const Vec3& b_side,
                                           const Vec3& c_side, const Surface& surface);
