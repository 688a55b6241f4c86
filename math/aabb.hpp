#ifndef GEOMILL_MATH_AABB_HPP
#define GEOMILL_MATH_AABB_HPP

#include <math/vec3.hpp>
#include <limits>
#include <vector>

namespace geomill {

struct Aabb3 {
    Vec3 min{std::numeric_limits<float>::max(),
             std::numeric_limits<float>::max(),
             std::numeric_limits<float>::max()};
    Vec3 max{std::numeric_limits<float>::lowest(),
             std::numeric_limits<float>::lowest(),
             std::numeric_limits<float>::lowest()};

    bool empty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }

    void expand(const Vec3& p) {
        min = component_min(min, p);
        max = component_max(max, p);
    }

    void grow(float amount) {
        Vec3 pad{amount, amount, amount};
        min -= pad;
        max += pad;
    }

    Vec3 size() const { return empty() ? Vec3{} : max - min; }

    Vec3 center() const { return (min + max) * 0.5f; }

    float longest_side() const {
        Vec3 s = size();
        return std::max(s.x, std::max(s.y, s.z));
    }

    bool intersects(const Aabb3& o) const {
        return min.x <= o.max.x && max.x >= o.min.x &&
               min.y <= o.max.y && max.y >= o.min.y &&
               min.z <= o.max.z && max.z >= o.min.z;
    }

    void merge(const Aabb3& o) {
        if (!o.empty()) {
            expand(o.min);
            expand(o.max);
        }
    }

    bool contains_xy(float x, float y) const {
        return x >= min.x && x <= max.x && y >= min.y && y <= max.y;
    }

    static Aabb3 of(const std::vector<Vec3>& points) {
        Aabb3 box;
        for (const auto& p : points) {
            box.expand(p);
        }
        return box;
    }
};

}  // namespace geomill

#endif // GEOMILL_MATH_AABB_HPP
