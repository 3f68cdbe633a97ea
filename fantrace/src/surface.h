#pragma once
#include <variant>
#include "core.h"

/**
 * @brief Diffuse (matte) reflector.
 * Emits nothing; reflects its color toward any outgoing direction on the
 * opposite side of the surface from the sample direction.
 */
struct Matte {
    /// Reflectance per channel.
    Color color;

    /// Always black.
    Color emitted() const { return Color(); }

    /**
     * @brief Reflected weight for a (sample, outgoing) pair.
     * @param n Surface normal (either orientation).
     * @param i Sample direction leaving the surface.
     * @param o Direction of the ray that arrived at the surface.
     * @return color, or black for grazing samples and same-side pairs.
     *         No cosine weighting is applied here.
     */
    Color reflected(const Vec3& n, const Vec3& i, const Vec3& o) const;
};

/// Pure emitter: shines its color, reflects nothing.
struct Light {
    /// Emitted radiance per channel.
    Color color;

    Color emitted() const { return color; }
    Color reflected(const Vec3&, const Vec3&, const Vec3&) const { return Color(); }
};

/**
 * @brief What light does at a hit point.
 * Closed tagged variant over the known surface kinds. A new kind needs a
 * struct with emitted()/reflected() of the same shape and an entry in Kind.
 * Immutable once built, so one Surface may be read from any thread.
 */
class Surface {
public:
    using Kind = std::variant<Matte, Light>;

    Surface(const Matte& m) : kind_(m) {}
    Surface(const Light& l) : kind_(l) {}

    static Surface matte(const Color& c) { return Surface(Matte{c}); }
    static Surface light(const Color& c) { return Surface(Light{c}); }

    /// Light leaving the surface on its own.
    Color emitted() const;

    /**
     * @brief Weight applied to light arriving along sample direction i and
     * leaving along o, for a surface with normal n.
     */
    Color reflected(const Vec3& n, const Vec3& i, const Vec3& o) const;

    /// Lower-case kind name ("matte", "light") for diagnostics.
    const char* name() const;

    const Kind& kind() const { return kind_; }

private:
    Kind kind_;
};
