#pragma once
#include <chrono>
#include <optional>
#include <vector>
#include "camera.h"
#include "core.h"
#include "scene.h"
#include "tracer.h"

/**
 * @brief Directional sky disc seen by primary rays that miss every triangle.
 * Lives outside the transport: bounce rays never see it.
 */
struct Sun {
    /// Direction toward the sun (any length).
    Vec3   direction{1,1,1};
    /// Angular radius in radians.
    double angle{deg2rad(30.0)};
    /// Color returned inside the disc.
    Color  color{1,1,1};

    /// color if dir points into the disc, black otherwise.
    Color radiance(const Vec3& dir) const;
};

/// RenderSettings: knobs of the pixel loop.
struct RenderSettings {
    /// Worker threads; 0 picks std::thread::hardware_concurrency().
    unsigned threads{0};
    /// Print a progress bar to stdout.
    bool     progress{true};
};

/**
 * @brief Color of one primary ray: the traced light on a hit, the sun on a miss.
 * The scene is searched once; the hit found is handed to Tracer::shade.
 * @param sun Optional environment term.
 */
Color shade_primary(const Scene& scene, const Tracer& tracer, const Ray& r,
                    const std::optional<Sun>& sun);

/**
 * @brief Render one camera view into a linear RGB buffer.
 * Rows are shared out to worker threads; all of them read the same scene and
 * tracer without locking.
 * @param width View width in pixels (> 0).
 * @param height View height in pixels (> 0).
 * @return Row-major buffer of width*height colors, row 0 at the top.
 */
std::vector<Color> render_view(const Scene& scene, const Tracer& tracer,
                               const Camera& camera, int width, int height,
                               const std::optional<Sun>& sun,
                               const RenderSettings& settings);

/**
 * @brief Print a console progress bar with ETA.
 * @param current Completed units (e.g., finished rows).
 * @param total Total units.
 * @param start_time Start timestamp for ETA calculation.
 */
void print_progress(int current, int total,
                    std::chrono::steady_clock::time_point start_time);
