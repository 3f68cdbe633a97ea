/**
 * @brief JSON loader unit tests for tracer settings, views, surfaces, objects, and validation.
 * Verifies defaults, named and inline surfaces, parallelogram expansion, and error reporting.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include "json_loader.h"

namespace {

/// Smallest valid document: one view, no objects.
const std::string kMinimal = R"({
    "views": [
        { "camera": { "position": [0, 0, 10], "direction": [0, 0, -1] },
          "viewport": [0, 0, 40, 30] }
    ]
})";

/// Wrap an objects array into a minimal valid document.
std::string with_objects(const std::string& objects, const std::string& extra = "") {
    return R"({
        "views": [ { "camera": { "position": [0, 0, 10], "direction": [0, 0, -1] },
                     "viewport": [0, 0, 4, 3] } ],)" + extra + R"(
        "objects": )" + objects + "}";
}

} // namespace

TEST_CASE("JSON scene loading", "[json][loader]") {
    const std::string testJson = R"({
        "tracer":  { "rays": 4, "depth": 2 },
        "render":  { "threads": 3 },
        "image":   { "width": 1001, "height": 601, "background": [255, 255, 255] },
        "tone":    { "exposure": 0.5, "gamma": 2.2 },
        "sun":     { "direction": [1, 1, 1], "angle": 30, "color": [1, 1, 1] },
        "surfaces": {
            "red":  { "matte": [0.5, 0.02, 0.02] },
            "lamp": { "light": [4, 4, 4] }
        },
        "views": [
            { "camera": { "position": [0, 0, 10], "direction": [0, 0, -2],
                          "up": [0, 1, 0], "aperture": 30 },
              "viewport": [0, 0, 500, 300] },
            { "camera": { "position": [20, 0, -10], "direction": [-1, 0, 0] },
              "viewport": [501, 301, 500, 300] }
        ],
        "objects": [
            { "triangle": { "vertices": [[2, 1, -8], [0, 0, -10], [-1, 1, -9]], "surface": "red" } },
            { "parallelogram": { "corner": [-6, 8, -4], "b_side": [12, 0, 0], "c_side": [0, 0, -12],
                                 "surface": "lamp" } },
            { "triangle": { "vertices": [[0, 0, 0], [1, 0, 0], [0, 1, 0]],
                            "surface": { "matte": [0.1, 0.2, 0.3] } } }
        ]
    })";

    const RenderJob job = jsonio::load_scene_from_json_text(testJson);

    SECTION("Tracer, render, and tone settings") {
        REQUIRE(job.rays == 4);
        REQUIRE(job.depth == 2);
        REQUIRE(job.settings.threads == 3);
        REQUIRE(job.tone.exposure == Catch::Approx(0.5));
        REQUIRE(job.tone.gamma == Catch::Approx(2.2));
    }

    SECTION("Image and views") {
        REQUIRE(job.width == 1001);
        REQUIRE(job.height == 601);
        REQUIRE(job.background == std::array<int, 3>{255, 255, 255});
        REQUIRE(job.views.size() == 2);
        REQUIRE(job.views[1].viewport.x == 501);
        REQUIRE(job.views[1].viewport.height == 300);
    }

    /// Direction is normalized; aperture converted from degrees.
    SECTION("Camera fields") {
        const Camera& cam = job.views[0].camera;
        REQUIRE(cam.origin == Vec3(0, 0, 10));
        REQUIRE(cam.dir.z == Catch::Approx(-1.0));
        REQUIRE(cam.aperture == Catch::Approx(deg2rad(30.0)));
        REQUIRE(job.views[1].camera.up == Vec3(0, 1, 0));
    }

    SECTION("Sun block") {
        REQUIRE(job.sun.has_value());
        REQUIRE(job.sun->angle == Catch::Approx(deg2rad(30.0)));
        REQUIRE(job.sun->color == Color(1, 1, 1));
    }

    /// A parallelogram contributes two triangles.
    SECTION("Objects and surfaces") {
        REQUIRE(job.scene.triangles.size() == 4);
        REQUIRE(job.scene.triangles[0].surface().reflected(
                    Vec3(0, 0, 1), Vec3(0, 0, 1), Vec3(0, 0, -1)) == Color(0.5, 0.02, 0.02));
        REQUIRE(job.scene.triangles[1].surface().emitted() == Color(4, 4, 4));
        REQUIRE(job.scene.triangles[2].surface().emitted() == Color(4, 4, 4));
        REQUIRE(std::string(job.scene.triangles[3].surface().name()) == "matte");
    }
}

TEST_CASE("JSON defaults", "[json][defaults]") {
    const RenderJob job = jsonio::load_scene_from_json_text(kMinimal);

    REQUIRE(job.rays == 6);
    REQUIRE(job.depth == 3);
    REQUIRE(job.settings.threads == 0);
    REQUIRE(job.tone.exposure == Catch::Approx(1.0));
    REQUIRE(job.tone.gamma == Catch::Approx(1.0));
    REQUIRE_FALSE(job.sun.has_value());
    REQUIRE(job.scene.triangles.empty());

    /// Image size falls back to the viewport bounding box.
    REQUIRE(job.width == 40);
    REQUIRE(job.height == 30);
    REQUIRE(job.background == std::array<int, 3>{0, 0, 0});
    REQUIRE(job.views[0].camera.aperture == Catch::Approx(deg2rad(30.0)));
}

TEST_CASE("JSON validation", "[json][errors]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json_text("{ invalid json }"), std::runtime_error);
    }

    SECTION("Missing views") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(R"({ "objects": [] })"));
    }

    SECTION("Unknown object kind") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects(
            R"([ { "sphere": { "position": [0, 0, 0], "radius": 1 } } ])")));
    }

    SECTION("Unknown surface name") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects(
            R"([ { "triangle": { "vertices": [[0,0,0],[1,0,0],[0,1,0]], "surface": "chrome" } } ])")));
    }

    SECTION("Unknown surface kind") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects(
            R"([ { "triangle": { "vertices": [[0,0,0],[1,0,0],[0,1,0]], "surface": { "mirror": [1,1,1] } } } ])")));
    }

    SECTION("Triangle needs three vertices") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects(
            R"([ { "triangle": { "vertices": [[0,0,0],[1,0,0]], "surface": { "matte": [1,1,1] } } } ])")));
    }

    SECTION("Zero ray count") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "tracer": { "rays": 0 },)")));
    }

    SECTION("Viewport past the image") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "image": { "width": 2 },)")));
    }

    /// x + width would wrap past INT_MAX.
    SECTION("Viewport origin overflow") {
        const std::string huge = R"({
            "image": { "width": 10, "height": 1 },
            "views": [ { "camera": { "position": [0, 0, 0], "direction": [0, 0, -1] },
                         "viewport": [2147483000, 0, 1000, 1] } ]
        })";
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json_text(huge), std::runtime_error);

        const std::string unsized = R"({
            "views": [ { "camera": { "position": [0, 0, 0], "direction": [0, 0, -1] },
                         "viewport": [2147483000, 0, 1000, 1] } ]
        })";
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json_text(unsized), std::runtime_error);
    }

    SECTION("Integer fields reject fractions") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "tracer": { "rays": 6.7 },)")));
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "tracer": { "depth": 1e20 },)")));
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "render": { "threads": 2.5 },)")));
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "image": { "background": [0, 127.5, 0] },)")));
    }

    SECTION("Integer fields reject values past int range") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "tracer": { "depth": 4294967296 },)")));
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(with_objects("[]", R"( "image": { "width": 18446744073709551615 },)")));
    }

    SECTION("Camera up parallel to direction") {
        REQUIRE_THROWS(jsonio::load_scene_from_json_text(R"({
            "views": [ { "camera": { "position": [0, 0, 0], "direction": [0, 1, 0], "up": [0, 2, 0] },
                         "viewport": [0, 0, 4, 3] } ]
        })"));
    }

    /// Zero-area triangles keep their dedicated error type.
    SECTION("Degenerate triangle") {
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json_text(with_objects(
            R"([ { "triangle": { "vertices": [[0,0,0],[1,1,1],[2,2,2]], "surface": { "matte": [1,1,1] } } } ])")),
            DegenerateGeometryError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json("/nonexistent-fantrace-dir/scene.json"), std::runtime_error);
    }
}
