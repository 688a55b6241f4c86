#ifndef GEOMILL_VORONOI_PLANAR_FRAME_HPP
#define GEOMILL_VORONOI_PLANAR_FRAME_HPP

#include <math/vec3.hpp>
#include <cstdint>
#include <vector>

namespace geomill::voronoi {

enum class Plane { XY, XZ, YZ };

const char* to_string(Plane plane);

struct IntPoint {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const IntPoint& o) const { return x == o.x && y == o.y; }
    bool operator<(const IntPoint& o) const { return x != o.x ? x < o.x : y < o.y; }
};

// Maps points lying in one axis-aligned plane to the integer grid the
// Voronoi builder works on, and back.
class PlanarFrame {
public:
    // Throws ExecutionError when the points are not finite or do not share
    // one axis-aligned plane. `grid_size` is the integer extent assigned to
    // the longest side.
    static PlanarFrame fit(const std::vector<Vec3>& points, double grid_size);

    Plane plane() const { return plane_; }
    double scale() const { return scale_; }

    Vec2 project(const Vec3& p) const;
    IntPoint to_grid(const Vec3& p) const;
    Vec3 to_world(const Vec2& grid) const;

    // Converts a world distance to grid units
    double to_grid_distance(double d) const { return d * scale_; }

private:
    Plane plane_ = Plane::XY;
    float depth_ = 0.0f;
    Vec2 origin_;
    double scale_ = 1.0;
};

}  // namespace geomill::voronoi

#endif // GEOMILL_VORONOI_PLANAR_FRAME_HPP
