#include "drop_cutter.hpp"
#include <algorithm>
#include <cmath>

namespace geomill::toolpath {

namespace {

// Keeps the bucket grid bounded for very small tools on large parts
constexpr size_t MAX_BUCKETS_PER_SIDE = 512;

std::optional<float> higher(std::optional<float> a, std::optional<float> b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

}  // namespace

bool inside_triangle_xy(float x, float y, const Vec3& a, const Vec3& b, const Vec3& c) {
    auto side = [&](const Vec3& p0, const Vec3& p1) {
        return (double(p1.x) - p0.x) * (double(y) - p0.y) - (double(p1.y) - p0.y) * (double(x) - p0.x);
    };
    double s0 = side(a, b);
    double s1 = side(b, c);
    double s2 = side(c, a);
    bool has_neg = s0 < 0.0 || s1 < 0.0 || s2 < 0.0;
    bool has_pos = s0 > 0.0 || s1 > 0.0 || s2 > 0.0;
    return !(has_neg && has_pos);
}

DropCutter::DropCutter(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& triangles,
                       const Probe& probe)
    : probe_(probe) {
    for (size_t t = 0; t + 2 < triangles.size(); t += 3) {
        Triangle tri{vertices[triangles[t]], vertices[triangles[t + 1]], vertices[triangles[t + 2]], {}};
        Vec3 n = (tri.b - tri.a).cross(tri.c - tri.a).normalized();
        tri.normal = n.z < 0.0f ? -n : n;
        bounds_.expand(tri.a);
        bounds_.expand(tri.b);
        bounds_.expand(tri.c);
        triangles_.push_back(tri);
    }
    if (triangles_.empty()) {
        return;
    }

    Vec3 size = bounds_.size();
    cell_ = std::max(2.0f * probe_.radius,
                     std::max(size.x, size.y) / static_cast<float>(MAX_BUCKETS_PER_SIDE));
    cell_ = std::max(cell_, 1e-6f);
    cells_x_ = static_cast<size_t>(size.x / cell_) + 1;
    cells_y_ = static_cast<size_t>(size.y / cell_) + 1;
    buckets_.assign(cells_x_ * cells_y_, {});

    auto cell_of = [&](float v, float lo, size_t n) {
        auto i = static_cast<int64_t>(std::floor((v - lo) / cell_));
        return static_cast<size_t>(std::clamp<int64_t>(i, 0, static_cast<int64_t>(n) - 1));
    };
    float r = probe_.radius;
    for (size_t t = 0; t < triangles_.size(); ++t) {
        const Triangle& tri = triangles_[t];
        float min_x = std::min({tri.a.x, tri.b.x, tri.c.x}) - r;
        float max_x = std::max({tri.a.x, tri.b.x, tri.c.x}) + r;
        float min_y = std::min({tri.a.y, tri.b.y, tri.c.y}) - r;
        float max_y = std::max({tri.a.y, tri.b.y, tri.c.y}) + r;
        for (size_t cy = cell_of(min_y, bounds_.min.y, cells_y_); cy <= cell_of(max_y, bounds_.min.y, cells_y_); ++cy) {
            for (size_t cx = cell_of(min_x, bounds_.min.x, cells_x_); cx <= cell_of(max_x, bounds_.min.x, cells_x_); ++cx) {
                buckets_[cy * cells_x_ + cx].push_back(static_cast<uint32_t>(t));
            }
        }
    }
}

std::optional<float> DropCutter::height_at(float x, float y) const {
    if (triangles_.empty()) {
        return std::nullopt;
    }
    float r = probe_.radius;
    if (x < bounds_.min.x - r || x > bounds_.max.x + r ||
        y < bounds_.min.y - r || y > bounds_.max.y + r) {
        return std::nullopt;
    }
    auto cx = static_cast<int64_t>(std::floor((x - bounds_.min.x) / cell_));
    auto cy = static_cast<int64_t>(std::floor((y - bounds_.min.y) / cell_));
    cx = std::clamp<int64_t>(cx, 0, static_cast<int64_t>(cells_x_) - 1);
    cy = std::clamp<int64_t>(cy, 0, static_cast<int64_t>(cells_y_) - 1);

    std::optional<float> best;
    for (uint32_t t : buckets_[static_cast<size_t>(cy) * cells_x_ + static_cast<size_t>(cx)]) {
        best = higher(best, contact(triangles_[t], x, y));
    }
    return best;
}

std::optional<float> DropCutter::contact(const Triangle& tri, float x, float y) const {
    std::optional<float> h;
    if (probe_.shape == ProbeShape::BallNose) {
        h = higher(h, ball_facet(tri, x, y));
        h = higher(h, ball_edge(tri.a, tri.b, x, y));
        h = higher(h, ball_edge(tri.b, tri.c, x, y));
        h = higher(h, ball_edge(tri.c, tri.a, x, y));
        h = higher(h, ball_vertex(tri.a, x, y));
        h = higher(h, ball_vertex(tri.b, x, y));
        h = higher(h, ball_vertex(tri.c, x, y));
    } else {
        h = higher(h, flat_facet(tri, x, y));
        h = higher(h, flat_edge(tri.a, tri.b, x, y));
        h = higher(h, flat_edge(tri.b, tri.c, x, y));
        h = higher(h, flat_edge(tri.c, tri.a, x, y));
        h = higher(h, flat_vertex(tri.a, x, y));
        h = higher(h, flat_vertex(tri.b, x, y));
        h = higher(h, flat_vertex(tri.c, x, y));
    }
    return h;
}

std::optional<float> DropCutter::ball_vertex(const Vec3& v, float x, float y) const {
    float r = probe_.radius;
    float dx = v.x - x;
    float dy = v.y - y;
    float d2 = dx * dx + dy * dy;
    if (d2 > r * r) {
        return std::nullopt;
    }
    return v.z + std::sqrt(r * r - d2) - r;
}

std::optional<float> DropCutter::ball_edge(const Vec3& p0, const Vec3& p1, float x, float y) const {
    // Work in the vertical plane through the edge: s runs along the edge's
    // XY direction, h is the XY distance from the query to the edge line.
    float r = probe_.radius;
    Vec2 d(p1.x - p0.x, p1.y - p0.y);
    double len = d.length();
    if (len < 1e-9) {
        return std::nullopt;
    }
    Vec2 u = d * (1.0 / len);
    Vec2 q(double(x) - p0.x, double(y) - p0.y);
    double h = std::abs(u.cross(q));
    if (h >= r) {
        return std::nullopt;
    }
    double s0 = u.dot(q);
    double m = (double(p1.z) - p0.z) / len;
    double radius2 = double(r) * r - h * h;
    double R = std::sqrt(radius2);
    double root = std::sqrt(1.0 + m * m);
    double s = s0 + m * R / root;
    if (s < 0.0 || s > len) {
        return std::nullopt;
    }
    double center = p0.z + m * s + R / root;
    return static_cast<float>(center - r);
}

std::optional<float> DropCutter::ball_facet(const Triangle& tri, float x, float y) const {
    const Vec3& n = tri.normal;
    if (n.z < 1e-6f) {
        return std::nullopt;
    }
    float r = probe_.radius;
    // Ball center sits r above the plane along the normal
    float center_z = tri.a.z + (r - n.x * (x - tri.a.x) - n.y * (y - tri.a.y)) / n.z;
    Vec3 touch = Vec3(x, y, center_z) - n * r;
    if (!inside_triangle_xy(touch.x, touch.y, tri.a, tri.b, tri.c)) {
        return std::nullopt;
    }
    return center_z - r;
}

std::optional<float> DropCutter::flat_vertex(const Vec3& v, float x, float y) const {
    float r = probe_.radius;
    float dx = v.x - x;
    float dy = v.y - y;
    if (dx * dx + dy * dy > r * r) {
        return std::nullopt;
    }
    return v.z;
}

std::optional<float> DropCutter::flat_edge(const Vec3& p0, const Vec3& p1, float x, float y) const {
    // Part of the edge inside the disk, highest end of that interval
    double r = probe_.radius;
    Vec2 d(p1.x - p0.x, p1.y - p0.y);
    Vec2 f(double(p0.x) - x, double(p0.y) - y);
    double a = d.dot(d);
    if (a < 1e-18) {
        return std::nullopt;
    }
    double b = 2.0 * f.dot(d);
    double c = f.dot(f) - r * r;
    double disc = b * b - 4.0 * a * c;
    if (disc < 0.0) {
        return std::nullopt;
    }
    double sq = std::sqrt(disc);
    double t0 = std::max(0.0, (-b - sq) / (2.0 * a));
    double t1 = std::min(1.0, (-b + sq) / (2.0 * a));
    if (t0 > t1) {
        return std::nullopt;
    }
    double z0 = p0.z + (double(p1.z) - p0.z) * t0;
    double z1 = p0.z + (double(p1.z) - p0.z) * t1;
    return static_cast<float>(std::max(z0, z1));
}

std::optional<float> DropCutter::flat_facet(const Triangle& tri, float x, float y) const {
    const Vec3& n = tri.normal;
    if (n.z < 1e-6f) {
        return std::nullopt;
    }
    float r = probe_.radius;
    // The plane rises against the horizontal part of its normal; the rim
    // point on that side touches first
    float px = x;
    float py = y;
    float nxy = std::sqrt(n.x * n.x + n.y * n.y);
    if (nxy > 1e-9f) {
        px -= r * n.x / nxy;
        py -= r * n.y / nxy;
    }
    if (!inside_triangle_xy(px, py, tri.a, tri.b, tri.c)) {
        return std::nullopt;
    }
    return tri.a.z - (n.x * (px - tri.a.x) + n.y * (py - tri.a.y)) / n.z;
}

}  // namespace geomill::toolpath
