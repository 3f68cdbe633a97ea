#include <iostream>
#include <string>
#include <vector>

#include "core.h"
#include "image_writer.h"
#include "json_loader.h"
#include "render.h"
#include "tracer.h"

/**
 * @brief Program entry: load scene JSON, render every view, and write the image.
 * @param argc Argument count.
 * @param argv Arguments: <scene.json> <output.png>.
 * @return Exit code: 0 on success; 1 usage, 3 load/validation, 4 I/O errors.
 */
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <scene.json> <output.png>\n";
        return 1;
    }
    const std::string json_path = argv[1];
    const std::string out_path  = argv[2];

    RenderJob job;
    try {
        job = jsonio::load_scene_from_json(json_path);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 3;
    }

    try {
        const Tracer tracer(job.rays, job.depth);
        Canvas canvas(job.width, job.height, job.background);

        std::cout << "Scene: " << job.scene.triangles.size() << " triangles\n";

        for (std::size_t i = 0; i < job.views.size(); ++i) {
            const View& v = job.views[i];
            std::cout << "Rendering view " << (i + 1) << "/" << job.views.size()
                      << " (" << v.viewport.width << "x" << v.viewport.height << ", "
                      << tracer.directions().size() << " directions, depth " << tracer.max_depth() << ")\n";

            const std::vector<Color> fb = render_view(job.scene, tracer, v.camera,
                                                      v.viewport.width, v.viewport.height,
                                                      job.sun, job.settings);
            canvas.blit(v.viewport, fb, job.tone);
        }

        try {
            canvas.save(out_path);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 4;
        }
        std::cout << "Wrote " << out_path << " (" << canvas.width() << "x" << canvas.height() << ")\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 3;
    }
    return 0;
}
