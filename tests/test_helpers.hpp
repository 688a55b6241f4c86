#ifndef GEOMILL_TEST_HELPERS_HPP
#define GEOMILL_TEST_HELPERS_HPP

#include <ffi/geomill_api.h>
#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>
#include <string>
#include <utility>
#include <vector>

namespace geomill {
namespace test {

// Owns the strings behind a StringMap, the way a host would build one
class HostConfig {
public:
    HostConfig() = default;

    HostConfig(std::initializer_list<std::pair<std::string, std::string>> entries) {
        for (const auto& [key, value] : entries) {
            add(key, value);
        }
    }

    void add(const std::string& key, const std::string& value) {
        keys_.push_back(key);
        values_.push_back(value);
    }

    // Pointers are rebuilt on every call so add() may be used in between
    const StringMap* map() {
        key_ptrs_.clear();
        value_ptrs_.clear();
        for (size_t i = 0; i < keys_.size(); ++i) {
            key_ptrs_.push_back(keys_[i].data());
            value_ptrs_.push_back(values_[i].data());
        }
        map_ = StringMap{key_ptrs_.data(), value_ptrs_.data(), keys_.size()};
        return &map_;
    }

private:
    std::vector<std::string> keys_;
    std::vector<std::string> values_;
    std::vector<char*> key_ptrs_;
    std::vector<char*> value_ptrs_;
    StringMap map_{};
};

// Unit square outline in XY as four edges
inline GeometryBuffer unit_square_edges() {
    GeometryBuffer square;
    square.vertices = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
    square.indices = {0, 1, 1, 2, 2, 3, 3, 0};
    return square;
}

// Axis-aligned closed box with outward-facing triangles
inline GeometryBuffer box_mesh(const Vec3& lo, const Vec3& hi) {
    GeometryBuffer box;
    box.vertices = {
        {lo.x, lo.y, lo.z}, {hi.x, lo.y, lo.z}, {hi.x, hi.y, lo.z}, {lo.x, hi.y, lo.z},
        {lo.x, lo.y, hi.z}, {hi.x, lo.y, hi.z}, {hi.x, hi.y, hi.z}, {lo.x, hi.y, hi.z}
    };
    box.indices = {
        0, 2, 1, 0, 3, 2,  // bottom
        4, 5, 6, 4, 6, 7,  // top
        0, 1, 5, 0, 5, 4,  // front
        2, 3, 7, 2, 7, 6,  // back
        1, 2, 6, 1, 6, 5,  // right
        3, 0, 4, 3, 4, 7   // left
    };
    return box;
}

// Single flat quad at height z covering [lo, hi] in XY
inline GeometryBuffer flat_quad(float lo, float hi, float z) {
    GeometryBuffer quad;
    quad.vertices = {{lo, lo, z}, {hi, lo, z}, {hi, hi, z}, {lo, hi, z}};
    quad.indices = {0, 1, 2, 0, 2, 3};
    return quad;
}

}  // namespace test
}  // namespace geomill

#endif // GEOMILL_TEST_HELPERS_HPP
