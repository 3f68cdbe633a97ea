#include "json_loader.h"

// STL
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

// Project headers
#include "core.h"
#include "geometry.h"
#include "surface.h"

// JSON
#include <nlohmann/json.hpp>
using nlohmann::json;

namespace {

/// Named surfaces declared in the "surfaces" block.
using SurfaceTable = std::map<std::string, Surface>;

/**
 * @brief Read key or fallback from a JSON object.
 * @param j Source object.
 * @param key Property to read.
 * @param fallback Value returned if key is absent.
 * @return Parsed value of T or fallback.
 */
template <typename T>
T get_or(const json& j, const char* key, const T& fallback) {
    if (!j.contains(key)) return fallback;
    return j.at(key).get<T>();
}

/**
 * @brief Parse a JSON array[3] into Vec3.
 * @param arr JSON array with 3 doubles.
 * @return Vec3 filled from arr.
 */
inline Vec3 as_vec3(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw std::runtime_error("Expected array[3]");
    return Vec3(arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>());
}

/// Parse a JSON array[3] into a linear Color.
inline Color as_rgb(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw std::runtime_error("Expected color array[3]");
    return Color(arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>());
}

/**
 * @brief Read an integer field that must fit an int.
 * Floats are rejected rather than truncated.
 * @param j Number node.
 * @param what Field name for the error message.
 */
inline int as_int(const json& j, const char* what) {
    if (!j.is_number_integer()) throw std::runtime_error(std::string(what) + " must be an integer");
    constexpr std::int64_t lo = std::numeric_limits<int>::min();
    constexpr std::int64_t hi = std::numeric_limits<int>::max();
    if (j.is_number_unsigned()) {
        if (j.get<std::uint64_t>() > static_cast<std::uint64_t>(hi))
            throw std::runtime_error(std::string(what) + " is out of range");
        return static_cast<int>(j.get<std::uint64_t>());
    }
    const std::int64_t v = j.get<std::int64_t>();
    if (v < lo || v > hi) throw std::runtime_error(std::string(what) + " is out of range");
    return static_cast<int>(v);
}

/// Parse a JSON array[3] of bytes in [0,255].
inline std::array<int, 3> as_rgb8(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw std::runtime_error("Expected byte color array[3]");
    std::array<int, 3> out{};
    for (int i = 0; i < 3; ++i) {
        const int v = as_int(arr[i], "byte color channel");
        if (v < 0 || v > 255) throw std::runtime_error("byte color channels must be in [0, 255]");
        out[i] = v;
    }
    return out;
}

/// Read a strictly positive integer.
inline int positive_int(const json& j, const char* what) {
    const int v = as_int(j, what);
    if (v <= 0) throw std::runtime_error(std::string(what) + " must be positive");
    return v;
}

/// Ensure node is a one-entry object (tagged union form).
inline void ensure_object_1key(const json& j, const char* what) {
    if (!j.is_object() || j.size() != 1) {
        throw std::runtime_error(std::string(what) + " must be a one-entry object");
    }
}

/**
 * @brief Build a Surface from an inline one-key block.
 * @param j {"matte": [r,g,b]} or {"light": [r,g,b]}.
 * @return Parsed surface.
 */
Surface parse_surface_block(const json& j) {
    ensure_object_1key(j, "surface");
    const auto it = j.begin();
    const std::string kind = it.key();

    if (kind == "matte") return Surface::matte(as_rgb(it.value()));
    if (kind == "light") return Surface::light(as_rgb(it.value()));

    throw std::runtime_error("unknown surface kind: " + kind);
}

/**
 * @brief Resolve a "surface" field: a name from the table or an inline block.
 * @param j String or one-key object.
 * @param table Named surfaces.
 * @return Resolved surface.
 */
Surface resolve_surface(const json& j, const SurfaceTable& table) {
    if (j.is_string()) {
        const std::string name = j.get<std::string>();
        const auto it = table.find(name);
        if (it == table.end()) throw std::runtime_error("unknown surface: " + name);
        return it->second;
    }
    return parse_surface_block(j);
}

/// Parse the "surfaces" block into a name table.
SurfaceTable parse_surfaces(const json& root) {
    SurfaceTable table;
    if (!root.contains("surfaces")) return table;
    const json& js = root.at("surfaces");
    if (!js.is_object()) throw std::runtime_error("'surfaces' must be an object");

    for (auto it = js.begin(); it != js.end(); ++it) {
        table.emplace(it.key(), parse_surface_block(it.value()));
    }
    return table;
}

/**
 * @brief Parse "tracer" block.
 * @param root Root JSON object.
 * @param job Output job (rays, depth).
 */
void parse_tracer(const json& root, RenderJob& job) {
    if (!root.contains("tracer")) return;
    const json& jt = root.at("tracer");

    if (jt.contains("rays")) {
        job.rays = static_cast<unsigned>(positive_int(jt.at("rays"), "tracer.rays"));
    }
    if (jt.contains("depth")) {
        const int d = as_int(jt.at("depth"), "tracer.depth");
        if (d < 0) throw std::runtime_error("tracer.depth must not be negative");
        job.depth = static_cast<unsigned>(d);
    }
}

/// Parse "render" block (thread count).
void parse_render(const json& root, RenderJob& job) {
    if (!root.contains("render")) return;
    const json& jr = root.at("render");

    const int threads = jr.contains("threads") ? as_int(jr.at("threads"), "render.threads") : 0;
    if (threads < 0) throw std::runtime_error("render.threads must not be negative");
    job.settings.threads = static_cast<unsigned>(threads);
}

/// Parse "tone" block (exposure, gamma).
void parse_tone(const json& root, RenderJob& job) {
    if (!root.contains("tone")) return;
    const json& jt = root.at("tone");

    job.tone.exposure = get_or<double>(jt, "exposure", 1.0);
    job.tone.gamma    = get_or<double>(jt, "gamma", 1.0);
    if (!(job.tone.gamma > 0.0)) throw std::runtime_error("tone.gamma must be positive");
}

/// Parse optional "sun" block; angle is given in degrees.
void parse_sun(const json& root, RenderJob& job) {
    if (!root.contains("sun")) return;
    const json& js = root.at("sun");

    Sun sun;
    if (js.contains("direction")) sun.direction = as_vec3(js.at("direction"));
    if (js.contains("angle"))     sun.angle     = deg2rad(js.at("angle").get<double>());
    if (js.contains("color"))     sun.color     = as_rgb(js.at("color"));
    if (sun.direction.length() == 0.0) throw std::runtime_error("sun.direction must not be zero");
    job.sun = sun;
}

/**
 * @brief Parse one camera block.
 * @param j Object with position, direction, up, and aperture (degrees).
 * @return Camera with a unit facing direction.
 */
Camera parse_camera(const json& j) {
    if (!j.contains("position") || !j.contains("direction"))
        throw std::runtime_error("camera requires 'position' and 'direction'");

    Camera cam;
    cam.origin = as_vec3(j.at("position"));
    const Vec3 dir = as_vec3(j.at("direction"));
    if (dir.length() == 0.0) throw std::runtime_error("camera.direction must not be zero");
    cam.dir = dir.normalized();
    if (j.contains("up")) cam.up = as_vec3(j.at("up"));
    if (cam.dir.cross(cam.up).length() == 0.0)
        throw std::runtime_error("camera.up must not be parallel to camera.direction");
    cam.aperture = deg2rad(get_or<double>(j, "aperture", 30.0));
    return cam;
}

/// Parse "views"; each view needs a camera and a viewport [x, y, width, height].
void parse_views(const json& root, RenderJob& job) {
    if (!root.contains("views")) throw std::runtime_error("'views' is required");
    const json& arr = root.at("views");
    if (!arr.is_array() || arr.empty()) throw std::runtime_error("'views' must be a non-empty array");

    for (const auto& jv : arr) {
        if (!jv.contains("camera") || !jv.contains("viewport"))
            throw std::runtime_error("each view needs 'camera' and 'viewport'");

        const json& jp = jv.at("viewport");
        if (!jp.is_array() || jp.size() != 4)
            throw std::runtime_error("viewport must be [x, y, width, height]");

        View v;
        v.camera = parse_camera(jv.at("camera"));
        v.viewport.x      = as_int(jp[0], "viewport x");
        v.viewport.y      = as_int(jp[1], "viewport y");
        v.viewport.width  = positive_int(jp[2], "viewport width");
        v.viewport.height = positive_int(jp[3], "viewport height");
        if (v.viewport.x < 0 || v.viewport.y < 0)
            throw std::runtime_error("viewport origin must not be negative");
        job.views.push_back(v);
    }
}

/// Parse "image" block; size defaults to the bounding box of all viewports.
void parse_image(const json& root, RenderJob& job) {
    // origin and size are both non-negative ints, so their sum fits in 64 bits
    std::int64_t right = 0, bottom = 0;
    for (const View& v : job.views) {
        right  = std::max<std::int64_t>(right,  std::int64_t(v.viewport.x) + v.viewport.width);
        bottom = std::max<std::int64_t>(bottom, std::int64_t(v.viewport.y) + v.viewport.height);
    }
    constexpr std::int64_t kMaxSide = std::numeric_limits<int>::max();
    int w = static_cast<int>(std::min(right, kMaxSide));
    int h = static_cast<int>(std::min(bottom, kMaxSide));

    if (root.contains("image")) {
        const json& ji = root.at("image");
        if (ji.contains("width"))      w = positive_int(ji.at("width"), "image.width");
        if (ji.contains("height"))     h = positive_int(ji.at("height"), "image.height");
        if (ji.contains("background")) job.background = as_rgb8(ji.at("background"));
    }

    for (const View& v : job.views) {
        if (v.viewport.x > w - v.viewport.width || v.viewport.y > h - v.viewport.height)
            throw std::runtime_error("viewport extends past the image");
    }
    job.width  = w;
    job.height = h;
}

/**
 * @brief Construct a triangle from JSON.
 * @param j Payload with vertices [[x,y,z] x3] and surface.
 * @param table Named surfaces.
 */
Triangle make_triangle(const json& j, const SurfaceTable& table) {
    if (!j.contains("vertices") || !j.contains("surface"))
        throw std::runtime_error("triangle requires 'vertices' and 'surface'");
    const json& jv = j.at("vertices");
    if (!jv.is_array() || jv.size() != 3)
        throw std::runtime_error("triangle.vertices must hold three points");

    return Triangle({ as_vec3(jv[0]), as_vec3(jv[1]), as_vec3(jv[2]) },
                    resolve_surface(j.at("surface"), table));
}

/**
 * @brief Construct the two triangles of a parallelogram from JSON.
 * @param j Payload with corner, b_side, c_side, and surface.
 * @param table Named surfaces.
 */
std::array<Triangle, 2> make_parallelogram_node(const json& j, const SurfaceTable& table) {
    if (!j.contains("corner") || !j.contains("b_side") || !j.contains("c_side") || !j.contains("surface"))
        throw std::runtime_error("parallelogram requires 'corner', 'b_side', 'c_side', 'surface'");

    return make_parallelogram(as_vec3(j.at("corner")),
                              as_vec3(j.at("b_side")),
                              as_vec3(j.at("c_side")),
                              resolve_surface(j.at("surface"), table));
}

/**
 * @brief Dispatch an object node to its builder and add the result.
 * @param jnode One-entry object: {kind: payload}.
 * @param table Named surfaces.
 * @param scene Scene receiving the triangles.
 */
void parse_object_node(const json& jnode, const SurfaceTable& table, Scene& scene) {
    ensure_object_1key(jnode, "object node");
    const auto it = jnode.begin();
    const std::string kind = it.key();
    const json& val = it.value();

    if (kind == "triangle") {
        scene.add(make_triangle(val, table));
        return;
    }
    if (kind == "parallelogram") {
        scene.add_all(make_parallelogram_node(val, table));
        return;
    }

    throw std::runtime_error("unknown object kind: " + kind);
}

} // anon

// ---------- public API ----------
namespace jsonio {

/**
 * @brief Parse a render job from JSON text.
 * @param json_text UTF-8 JSON string.
 * @return Parsed job; throws on parse/validation errors. Zero-area triangles
 *         keep their DegenerateGeometryError type.
 */
RenderJob load_scene_from_json_text(const std::string& json_text) {
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) throw std::runtime_error("scene root must be an object");

        RenderJob job;
        parse_tracer(root, job);
        parse_render(root, job);
        parse_tone(root, job);
        parse_sun(root, job);
        parse_views(root, job);
        parse_image(root, job);

        const SurfaceTable table = parse_surfaces(root);

        if (root.contains("objects")) {
            const json& arr = root.at("objects");
            if (!arr.is_array()) throw std::runtime_error("'objects' must be an array");
            for (const auto& node : arr) {
                parse_object_node(node, table, job.scene);
            }
        }
        return job;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
    } catch (const DegenerateGeometryError& e) {
        throw DegenerateGeometryError(std::string("JSON processing error: ") + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("JSON processing error: ") + e.what());
    }
}

/**
 * @brief Parse a render job from a JSON file on disk.
 * @param filename Path to scene.json.
 * @return Parsed job; throws on I/O or parse errors.
 */
RenderJob load_scene_from_json(const std::string& filename) {
    std::ifstream ifs(filename);
    if (!ifs) throw std::runtime_error("Cannot open JSON file: " + filename);
    std::ostringstream ss; ss << ifs.rdbuf();
    return load_scene_from_json_text(ss.str());
}

} // namespace jsonio
