#pragma once

#include <array>
#include <optional>
#include <string>
#include <stdexcept>
#include <vector>

#include "camera.h"
#include "image_writer.h"
#include "render.h"
#include "scene.h"

/// One camera and the part of the output image it fills.
struct View {
    Camera   camera;
    Viewport viewport;
};

/**
 * @brief Everything a render needs, as read from a scene file.
 * Tracer parameters are kept as numbers so the caller decides when to build
 * the direction fan.
 */
struct RenderJob {
    /// Triangles with their surfaces.
    Scene scene;
    /// Angle steps of the tracer's direction fan.
    unsigned rays{6};
    /// Maximum bounce depth.
    unsigned depth{3};
    /// Pixel-loop settings.
    RenderSettings settings;
    /// Output image width in pixels.
    int width{0};
    /// Output image height in pixels.
    int height{0};
    /// RGB bytes for pixels outside every viewport.
    std::array<int, 3> background{0, 0, 0};
    /// Linear-to-8-bit mapping.
    ToneMap tone;
    /// Optional sky term for primary misses.
    std::optional<Sun> sun;
    /// Cameras to render, in file order.
    std::vector<View> views;
};

/**
 * @brief JSON scene I/O utilities.
 * Loaders that build a RenderJob from disk or in-memory JSON.
 */
namespace jsonio {

/**
 * @brief Load a render job from a JSON file.
 * @param filename Path to scene description (UTF-8 JSON).
 * @return Parsed job.
 * @throws std::runtime_error on I/O, parse, or validation errors.
 */
RenderJob load_scene_from_json(const std::string& filename);

/**
 * @brief Load a render job from JSON text in memory.
 * @param json_text Scene JSON as a single string.
 * @return Parsed job.
 * @throws std::runtime_error on parse or validation errors.
 */
RenderJob load_scene_from_json_text(const std::string& json_text);

} // namespace jsonio
