#include "render.h"
#include <atomic>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <thread>

Color Sun::radiance(const Vec3& dir) const {
    if (dir.normalized().dot(direction.normalized()) > std::cos(angle)) return color;
    return Color();
}

Color shade_primary(const Scene& scene, const Tracer& tracer, const Ray& r,
                    const std::optional<Sun>& sun) {
    const std::optional<NearestHit> hit = scene.nearest_hit(r);
    if (!hit) return sun ? sun->radiance(r.d) : Color();
    return tracer.shade(scene, *hit, r, 0);
}

void print_progress(int current, int total,
                    std::chrono::steady_clock::time_point start_time) {
    const int barWidth = 50;
    float progress = total > 0 ? static_cast<float>(current) / total : 1.0f;

    std::cout << "\r[";
    int pos = static_cast<int>(barWidth * progress);
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();

    std::cout << "] " << int(progress * 100.0) << "% ";

    if (current > 0 && elapsed > 0) {
        float rate = static_cast<float>(current) / elapsed;
        int remaining = static_cast<int>((total - current) / rate);
        int minutes = remaining / 60;
        int seconds = remaining % 60;
        if (minutes > 0) std::cout << "| ETA: " << minutes << "m " << seconds << "s ";
        else std::cout << "| ETA: " << seconds << "s ";
    }
    std::cout << std::flush;
}

std::vector<Color> render_view(const Scene& scene, const Tracer& tracer,
                               const Camera& camera, int width, int height,
                               const std::optional<Sun>& sun,
                               const RenderSettings& settings) {
    std::vector<Color> framebuffer;
    if (width <= 0 || height <= 0) return framebuffer;

    framebuffer.assign(static_cast<std::size_t>(width) * height, Color());

    unsigned nThreads = settings.threads;
    if (nThreads == 0) nThreads = std::thread::hardware_concurrency();
    if (nThreads == 0) nThreads = 1;
    nThreads = std::min<unsigned>(nThreads, static_cast<unsigned>(height));

    std::atomic<int> next_row{0};
    std::atomic<int> rows_done{0};
    std::mutex print_mutex;
    const auto start_time = std::chrono::steady_clock::now();

    // Each worker owns the rows it claims; no two threads write the same pixel
    auto worker = [&]() {
        for (int y = next_row++; y < height; y = next_row++) {
            Color* row = &framebuffer[static_cast<std::size_t>(y) * width];
            for (int x = 0; x < width; ++x) {
                row[x] = shade_primary(scene, tracer, camera.generate_ray(x, y, width, height), sun);
            }
            const int done = ++rows_done;
            if (settings.progress && done % 5 == 0) {
                std::lock_guard<std::mutex> lock(print_mutex);
                print_progress(done, height, start_time);
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(nThreads);
    for (unsigned t = 0; t < nThreads; ++t) workers.emplace_back(worker);
    for (std::thread& w : workers) w.join();

    if (settings.progress) {
        print_progress(height, height, start_time);
        std::cout << "\n";
    }
    return framebuffer;
}
