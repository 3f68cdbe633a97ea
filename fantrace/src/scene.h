#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "core.h"
#include "geometry.h"

/// Thrown when a zero-area triangle is added to a scene.
class DegenerateGeometryError : public std::runtime_error {
public:
    explicit DegenerateGeometryError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Renderable world: a flat, unindexed list of triangles.
 * Owns its triangles; their addresses identify them during traversal, so the
 * list must not change while a render is running.
 */
struct Scene {
    /// Scene triangles in insertion order (order does not affect results).
    std::vector<Triangle> triangles;

    /**
     * @brief Append a triangle after validating it.
     * @throws DegenerateGeometryError if the triangle has zero area.
     */
    void add(const Triangle& tri);

    /// Append several triangles; stops at the first degenerate one.
    template <typename Range>
    void add_all(const Range& tris) {
        for (const Triangle& t : tris) add(t);
    }

    /**
     * @brief Find the nearest triangle hit along a ray.
     * @param r Ray to test.
     * @param exclude Triangle to skip (by identity), or nullptr.
     * @return Nearest hit, or nothing if every triangle is missed.
     */
    std::optional<NearestHit> nearest_hit(const Ray& r, const Triangle* exclude = nullptr) const;
};
