#include "tracer.h"
#include <cmath>
#include <cstddef>
#include <stdexcept>

Tracer::Tracer(unsigned rays, unsigned max_depth)
    : max_depth_(max_depth)
{
    if (rays == 0) throw std::invalid_argument("tracer needs at least one ray step");

    const double step = 360.0 / double(rays);
    const Vec3 u(1.0, 0.0, 0.0);

    dirs_.reserve(static_cast<std::size_t>(rays) * rays);
    for (unsigned i = 0; i < rays; ++i) {
        const Matrix3 elevation = Matrix3::rotation_z(deg2rad(i * step));
        for (unsigned j = 0; j < rays; ++j) {
            const Matrix3 azimuth = Matrix3::rotation_y(deg2rad(j * step));
            dirs_.push_back((azimuth * elevation) * u);
        }
    }
}

Color Tracer::trace(const Scene& scene, const Ray& r,
                    const Triangle* exclude, unsigned depth) const {
    // Stop condition
    if (depth > max_depth_) return Color();

    std::optional<NearestHit> hit = scene.nearest_hit(r, exclude);
    if (!hit) return Color();

    return shade(scene, *hit, r, depth);
}

Color Tracer::shade(const Scene& scene, const NearestHit& hit, const Ray& r, unsigned depth) const {
    const Triangle& tri = *hit.triangle;
    const Surface& surface = tri.surface();
    const Vec3& n = tri.normal();

    Color total = surface.emitted();

    for (const Vec3& dir : dirs_) {
        const Color refl = surface.reflected(n, dir, r.d);
        if (refl.is_black()) continue;  // wrong side or grazing

        const double lambert = std::abs(dir.dot(n));

        const Color in = trace(scene, Ray(hit.point, dir), &tri, depth + 1);
        total += hadamard(in, refl) * lambert;
    }

    return total;
}
