#pragma once
#include <vector>
#include "core.h"
#include "scene.h"

/**
 * @brief Deterministic recursive light gather over a fixed direction fan.
 * Every hit branches into the same rays² unit directions, so the cost grows as
 * (rays²)^max_depth; keep both parameters small. Holds no mutable state, so a
 * single Tracer may serve concurrent trace() calls.
 */
class Tracer {
public:
    /**
     * @brief Build the direction fan.
     * Angles a and b step through [0°, 360°) in rays increments; each pair
     * yields R_y(b)·R_z(a)·(1,0,0). Directions cover the whole sphere; the
     * hemisphere is picked per hit by the surface.
     * @param rays Steps per angle (> 0).
     * @param max_depth Deepest bounce that still gathers light.
     * @throws std::invalid_argument if rays is zero.
     */
    Tracer(unsigned rays, unsigned max_depth);

    /**
     * @brief Light arriving back along a ray.
     * @param scene Triangles to trace against.
     * @param r Ray to follow.
     * @param exclude Triangle the ray leaves from (skipped by identity), or nullptr.
     * @param depth Bounces taken so far; beyond max_depth the result is black.
     * @return Emitted light at the nearest hit plus the reflected, cosine
     *         weighted contributions of every sample direction. Black on a miss.
     */
    Color trace(const Scene& scene, const Ray& r,
                const Triangle* exclude = nullptr, unsigned depth = 0) const;

    /**
     * @brief Light leaving an already found hit back along the ray that made it.
     * trace() is the nearest-hit search followed by this call; callers that
     * have searched already use it to avoid a second scan.
     * @param hit Nearest hit of r.
     * @param r Ray that produced hit.
     * @param depth Bounces taken so far (<= max_depth).
     */
    Color shade(const Scene& scene, const NearestHit& hit, const Ray& r, unsigned depth) const;

    const std::vector<Vec3>& directions() const { return dirs_; }
    unsigned max_depth() const { return max_depth_; }

private:
    std::vector<Vec3> dirs_;
    unsigned max_depth_;
};
