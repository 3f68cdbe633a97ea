#include "camera.h"

Ray Camera::generate_ray(int x, int y, int width, int height) const {
    const double cx = 0.5 * width;
    const double cy = 0.5 * height;
    const double pix_ang = aperture / double(width);

    const double yaw   = (double(x) - cx) * pix_ang;
    const double pitch = (double(y) - cy) * pix_ang;

    const Vec3 right = dir.cross(up).normalized();

    // pitch first, then yaw
    const Matrix3 q = Matrix3::rotation(up.normalized(), -yaw) * Matrix3::rotation(right, -pitch);
    return Ray(origin, q * dir);
}
