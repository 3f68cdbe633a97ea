#include "surface.h"

Color Matte::reflected(const Vec3& n, const Vec3& i, const Vec3& o) const {
    const double v = i.dot(n);

    // Sample is perpendicular to the normal.
    if (v == 0.0) return Color();

    // Both rays leave on the same side: nothing to reflect.
    if (o.dot(n) / v > 0.0) return Color();

    return color;
}

Color Surface::emitted() const {
    return std::visit([](const auto& s) { return s.emitted(); }, kind_);
}

Color Surface::reflected(const Vec3& n, const Vec3& i, const Vec3& o) const {
    return std::visit([&](const auto& s) { return s.reflected(n, i, o); }, kind_);
}

const char* Surface::name() const {
    struct Namer {
        const char* operator()(const Matte&) const { return "matte"; }
        const char* operator()(const Light&) const { return "light"; }
    };
    return std::visit(Namer{}, kind_);
}
