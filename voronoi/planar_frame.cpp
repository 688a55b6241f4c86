#include "planar_frame.hpp"
#include <common/error.hpp>
#include <math/aabb.hpp>
#include <cmath>

namespace geomill::voronoi {

const char* to_string(Plane plane) {
    switch (plane) {
        case Plane::XY: return "XY";
        case Plane::XZ: return "XZ";
        case Plane::YZ: return "YZ";
    }
    return "?";
}

PlanarFrame PlanarFrame::fit(const std::vector<Vec3>& points, double grid_size) {
    if (points.empty()) {
        throw ExecutionError("no input vertices");
    }
    for (const auto& p : points) {
        if (!p.is_finite()) {
            throw ExecutionError("input contains a non-finite coordinate");
        }
    }

    Aabb3 box = Aabb3::of(points);
    Vec3 size = box.size();
    float longest = box.longest_side();
    if (longest <= 0.0f) {
        throw ExecutionError("input is degenerate (all vertices coincide)");
    }
    float flat = std::max(longest * 1e-5f, 1e-7f);

    PlanarFrame frame;
    if (size.z <= flat) {
        frame.plane_ = Plane::XY;
        frame.depth_ = box.center().z;
    } else if (size.y <= flat) {
        frame.plane_ = Plane::XZ;
        frame.depth_ = box.center().y;
    } else if (size.x <= flat) {
        frame.plane_ = Plane::YZ;
        frame.depth_ = box.center().x;
    } else {
        throw ExecutionError("input is not in an axis-aligned plane");
    }

    frame.origin_ = frame.project(box.min);
    Vec2 extent = frame.project(box.max) - frame.origin_;
    frame.scale_ = grid_size / std::max(extent.x, extent.y);
    return frame;
}

Vec2 PlanarFrame::project(const Vec3& p) const {
    switch (plane_) {
        case Plane::XY: return {p.x, p.y};
        case Plane::XZ: return {p.x, p.z};
        case Plane::YZ: return {p.y, p.z};
    }
    return {};
}

IntPoint PlanarFrame::to_grid(const Vec3& p) const {
    Vec2 q = (project(p) - origin_) * scale_;
    return {static_cast<int32_t>(std::lround(q.x)), static_cast<int32_t>(std::lround(q.y))};
}

Vec3 PlanarFrame::to_world(const Vec2& grid) const {
    auto u = static_cast<float>(grid.x / scale_ + origin_.x);
    auto v = static_cast<float>(grid.y / scale_ + origin_.y);
    switch (plane_) {
        case Plane::XY: return {u, v, depth_};
        case Plane::XZ: return {u, depth_, v};
        case Plane::YZ: return {depth_, u, v};
    }
    return {};
}

}  // namespace geomill::voronoi
