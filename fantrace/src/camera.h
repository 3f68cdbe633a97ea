#pragma once
#include "core.h"

/**
 * @brief Pinhole camera described by a viewing direction and an aperture.
 * Primary rays are made by turning the facing direction by a per-pixel yaw
 * (about up) and pitch (about the right axis).
 */
struct Camera {
    /// Eye position in world space.
    Vec3   origin{0,0,0};
    /// Facing direction (unit).
    Vec3   dir{0,0,-1};
    /// Up vector (any length); must not be parallel to dir.
    Vec3   up{0,1,0};
    /// Horizontal aperture angle in radians.
    double aperture{deg2rad(30.0)};

    /**
     * @brief Generate the primary ray through pixel (x,y).
     * @param x Pixel column in [0, width).
     * @param y Pixel row in [0, height), rows growing downward.
     * @param width Image width in pixels; the aperture spans it.
     * @param height Image height in pixels.
     * @return Ray from the eye; the center pixel looks straight along dir.
     */
    Ray generate_ray(int x, int y, int width, int height) const;
};
