#ifndef CORE_H
#define CORE_H

#include <cmath>
#include <algorithm>

/// Pi, spelled out so the header does not depend on M_PI.
constexpr double kPI = 3.14159265358979323846;

/// Degrees-to-radians conversion.
inline double deg2rad(double d){ return d * kPI / 180.0; }

/**
 * @brief Plain 3D vector over doubles.
 * Used for points and directions alike; provides the algebra needed by
 * planes, triangles, rays, and the camera.
 */
struct Vec3 {
    /// X component.
    double x{},
    /// Y component.
           y{},
    /// Z component.
           z{};

    /// Default-initialized (zeros).
    Vec3() = default;
    /// From components.
    Vec3(double xx, double yy, double zz): x(xx), y(yy), z(zz) {}

    /// Vector addition.
    Vec3 operator+(const Vec3& v) const { return {x+v.x, y+v.y, z+v.z}; }
    /// Vector subtraction.
    Vec3 operator-(const Vec3& v) const { return {x-v.x, y-v.y, z-v.z}; }
    /// Scalar multiply.
    Vec3 operator*(double s)     const { return {x*s, y*s, z*s}; }
    /// In-place addition.
    Vec3& operator+=(const Vec3& v){ x+=v.x; y+=v.y; z+=v.z; return *this; }
    /// Unary minus.
    Vec3 operator-() const { return {-x, -y, -z}; }
    /// Exact component-wise equality.
    bool operator==(const Vec3& v) const { return x==v.x && y==v.y && z==v.z; }
    bool operator!=(const Vec3& v) const { return !(*this == v); }

    /// Dot product.
    double dot(const Vec3& v) const { return x*v.x + y*v.y + z*v.z; }
    /// Cross product (right-handed).
    Vec3 cross(const Vec3& v) const {
        return { y*v.z - z*v.y, z*v.x - x*v.z, x*v.y - y*v.x };
    }
    /// Euclidean length.
    double length() const { return std::sqrt(dot(*this)); }
    /**
     * @brief Unit-length copy.
     * No fallback for tiny vectors: a zero vector yields NaN components,
     * which is how degenerate triangles are later detected.
     */
    Vec3 normalized() const {
        const double L = length();
        return {x/L, y/L, z/L};
    }
    /// True when every component is finite.
    bool is_finite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }
};

/// Scalar–vector multiplication.
inline Vec3 operator*(double s, const Vec3& v){ return v*s; }

/**
 * @brief Row-major 3×3 rotation matrix.
 * Supports composition, application to Vec3, and the axis rotations used
 * by the tracer's direction fan and by the camera.
 */
struct Matrix3 {
    /// Elements m[row][col].
    double m[3][3];

    /// Identity by default.
    Matrix3() {
        for (int i = 0; i < 3; i++) {
            for (int j = 0; j < 3; j++) {
                m[i][j] = (i == j) ? 1.0 : 0.0;
            }
        }
    }

    /// Construct from 9 scalars.
    Matrix3(double m00, double m01, double m02,
            double m10, double m11, double m12,
            double m20, double m21, double m22) {
        m[0][0] = m00; m[0][1] = m01; m[0][2] = m02;
        m[1][0] = m10; m[1][1] = m11; m[1][2] = m12;
        m[2][0] = m20; m[2][1] = m21; m[2][2] = m22;
    }

    /// Matrix composition (this ∘ other): other is applied first.
    Matrix3 operator*(const Matrix3& other) const {
        Matrix3 result;
        for (int i = 0; i < 3; i++) {
            for (int j = 0; j < 3; j++) {
                result.m[i][j] = 0;
                for (int k = 0; k < 3; k++) {
                    result.m[i][j] += m[i][k] * other.m[k][j];
                }
            }
        }
        return result;
    }

    /// Apply to Vec3.
    Vec3 operator*(const Vec3& v) const {
        return Vec3(
            m[0][0]*v.x + m[0][1]*v.y + m[0][2]*v.z,
            m[1][0]*v.x + m[1][1]*v.y + m[1][2]*v.z,
            m[2][0]*v.x + m[2][1]*v.y + m[2][2]*v.z
        );
    }

    /// Rotation about +X by angle (radians).
    static Matrix3 rotation_x(double angle) {
        double c = std::cos(angle);
        double s = std::sin(angle);
        return Matrix3(
            1, 0,  0,
            0, c, -s,
            0, s,  c
        );
    }

    /// Rotation about +Y by angle (radians).
    static Matrix3 rotation_y(double angle) {
        double c = std::cos(angle);
        double s = std::sin(angle);
        return Matrix3(
             c, 0, s,
             0, 1, 0,
            -s, 0, c
        );
    }

    /// Rotation about +Z by angle (radians).
    static Matrix3 rotation_z(double angle) {
        double c = std::cos(angle);
        double s = std::sin(angle);
        return Matrix3(
            c, -s, 0,
            s,  c, 0,
            0,  0, 1
        );
    }

    /**
     * @brief Rotation about an arbitrary axis (Rodrigues' formula).
     * @param axis Rotation axis; must be unit length.
     * @param angle Angle in radians, counter-clockwise looking down the axis.
     * @return R = cI + s[k]x + (1-c)kk^T.
     */
    static Matrix3 rotation(const Vec3& axis, double angle) {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        const double t = 1.0 - c;
        const double x = axis.x, y = axis.y, z = axis.z;
        return Matrix3(
            t*x*x + c,   t*x*y - s*z, t*x*z + s*y,
            t*x*y + s*z, t*y*y + c,   t*y*z - s*x,
            t*x*z - s*y, t*y*z + s*x, t*z*z + c
        );
    }
};

/**
 * @brief Geometric ray with origin and direction.
 * The direction is stored exactly as given; callers of the intersection
 * engine may pass unnormalized directions.
 */
struct Ray {
    /// Origin point.
    Vec3 o;
    /// Direction (not necessarily unit).
    Vec3 d;
    /// Default constructor.
    Ray() = default;
    /// Construct with origin and direction.
    Ray(const Vec3& oo, const Vec3& dd): o(oo), d(dd) {}
    /// Point at parameter t along the ray.
    Vec3 at(double t) const { return o + d*t; }
};

/**
 * @brief RGB transport weight with double channels.
 * Values are unbounded; black doubles as the additive identity and as the
 * "no contribution" sentinel.
 */
struct Color {
    /// Red channel.
    double r{},
    /// Green channel.
           g{},
    /// Blue channel.
           b{};

    /// Default-initialized (black).
    Color() = default;
    /// From components.
    Color(double rr, double gg, double bb): r(rr), g(gg), b(bb) {}
    /// Channel-wise addition.
    Color operator+(const Color& c) const { return {r+c.r, g+c.g, b+c.b}; }
    /// Scalar multiply.
    Color operator*(double s) const { return {r*s, g*s, b*s}; }
    /// In-place add.
    Color& operator+=(const Color& c){ r+=c.r; g+=c.g; b+=c.b; return *this; }
    /// Exact channel-wise equality.
    bool operator==(const Color& c) const { return r==c.r && g==c.g && b==c.b; }
    bool operator!=(const Color& c) const { return !(*this == c); }
    /// True for the zero element.
    bool is_black() const { return r == 0.0 && g == 0.0 && b == 0.0; }
};

/// Channel-wise (Hadamard) color product.
inline Color hadamard(const Color& a, const Color& b){
    return {a.r*b.r, a.g*b.g, a.b*b.b};
}

/// Clamp scalar to [0,1].
inline double clamp01(double v){ return std::max(0.0, std::min(1.0, v)); }

/// Map [0,1] to 8-bit [0,255] with rounding.
inline int toByte(double v){ return (int)std::round(clamp01(v)*255.0); }

#endif
