#include "scene.h"
#include <sstream>

namespace {

std::string describe(const Triangle& tri) {
    std::ostringstream ss;
    ss << "degenerate triangle";
    for (const Vec3& v : tri.vertices()) {
        ss << " (" << v.x << ", " << v.y << ", " << v.z << ")";
    }
    return ss.str();
}

} // anon

void Scene::add(const Triangle& tri) {
    if (tri.is_degenerate()) throw DegenerateGeometryError(describe(tri));
    triangles.push_back(tri);
}

std::optional<NearestHit> Scene::nearest_hit(const Ray& r, const Triangle* exclude) const {
    return ::nearest_hit(triangles, r, exclude);
}
