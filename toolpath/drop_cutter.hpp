#ifndef GEOMILL_TOOLPATH_DROP_CUTTER_HPP
#define GEOMILL_TOOLPATH_DROP_CUTTER_HPP

#include <math/aabb.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace geomill::toolpath {

enum class ProbeShape {
    BallNose,
    SquareEnd
};

struct Probe {
    ProbeShape shape = ProbeShape::BallNose;
    float radius = 1.0f;
};

// Lowest tool-tip height at an XY location such that the probe touches the
// triangle mesh without penetrating it. Triangles are bucketed on an XY grid
// so a query only visits triangles within reach of the probe.
class DropCutter {
public:
    DropCutter(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& triangles,
               const Probe& probe);

    // Tip height, or nullopt when no triangle is within reach
    std::optional<float> height_at(float x, float y) const;

    const Aabb3& bounds() const { return bounds_; }
    const Probe& probe() const { return probe_; }
    size_t triangle_count() const { return triangles_.size(); }

private:
    struct Triangle {
        Vec3 a;
        Vec3 b;
        Vec3 c;
        Vec3 normal;  // unit, pointing up (z >= 0)
    };

    std::optional<float> contact(const Triangle& tri, float x, float y) const;

    // Ball nose contacts; return the tip height
    std::optional<float> ball_vertex(const Vec3& v, float x, float y) const;
    std::optional<float> ball_edge(const Vec3& p0, const Vec3& p1, float x, float y) const;
    std::optional<float> ball_facet(const Triangle& tri, float x, float y) const;

    // Square end contacts
    std::optional<float> flat_vertex(const Vec3& v, float x, float y) const;
    std::optional<float> flat_edge(const Vec3& p0, const Vec3& p1, float x, float y) const;
    std::optional<float> flat_facet(const Triangle& tri, float x, float y) const;

    Probe probe_;
    std::vector<Triangle> triangles_;
    Aabb3 bounds_;

    float cell_ = 1.0f;
    size_t cells_x_ = 1;
    size_t cells_y_ = 1;
    std::vector<std::vector<uint32_t>> buckets_;
};

// XY point-in-triangle test, edges inclusive
bool inside_triangle_xy(float x, float y, const Vec3& a, const Vec3& b, const Vec3& c);

}  // namespace geomill::toolpath

#endif // GEOMILL_TOOLPATH_DROP_CUTTER_HPP
