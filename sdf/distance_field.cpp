#include "distance_field.hpp"
#include <algorithm>
#include <cmath>

namespace geomill::sdf {

float point_segment_distance(const Vec3& p, const Vec3& a, const Vec3& b) {
    Vec3 ab = b - a;
    float len2 = ab.length_squared();
    if (len2 <= 0.0f) {
        return p.distance_to(a);
    }
    float t = std::clamp((p - a).dot(ab) / len2, 0.0f, 1.0f);
    return p.distance_to(a + ab * t);
}

float point_triangle_distance(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    // Closest-point regions (Ericson, Real-Time Collision Detection 5.1.5)
    Vec3 ab = b - a;
    Vec3 ac = c - a;
    Vec3 ap = p - a;
    float d1 = ab.dot(ap);
    float d2 = ac.dot(ap);
    if (d1 <= 0.0f && d2 <= 0.0f) return p.distance_to(a);

    Vec3 bp = p - b;
    float d3 = ab.dot(bp);
    float d4 = ac.dot(bp);
    if (d3 >= 0.0f && d4 <= d3) return p.distance_to(b);

    float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        float v = d1 / (d1 - d3);
        return p.distance_to(a + ab * v);
    }

    Vec3 cp = p - c;
    float d5 = ab.dot(cp);
    float d6 = ac.dot(cp);
    if (d6 >= 0.0f && d5 <= d6) return p.distance_to(c);

    float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        float w = d2 / (d2 - d6);
        return p.distance_to(a + ac * w);
    }

    float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        float w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return p.distance_to(b + (c - b) * w);
    }

    float sum = va + vb + vc;
    if (sum == 0.0f) {
        // Degenerate triangle
        return std::min({point_segment_distance(p, a, b), point_segment_distance(p, b, c),
                         point_segment_distance(p, c, a)});
    }
    float v = vb / sum;
    float w = vc / sum;
    return p.distance_to(a + ab * v + ac * w);
}

void CapsuleField::add_capsule(const Vec3& a, const Vec3& b, float radius) {
    Capsule capsule{a, b, radius, {}};
    capsule.box.expand(a);
    capsule.box.expand(b);
    capsule.box.grow(radius);
    bounds_.merge(capsule.box);
    capsules_.push_back(capsule);
}

float CapsuleField::capsule_distance(const Capsule& c, const Vec3& p) {
    return point_segment_distance(p, c.a, c.b) - c.radius;
}

float CapsuleField::distance(const Vec3& p) const {
    float d = DEFAULT_SDF_VALUE;
    for (const auto& c : capsules_) {
        d = std::min(d, capsule_distance(c, p));
    }
    return d;
}

void CapsuleField::sample_chunk(const ChunkGrid& grid, float margin, std::vector<float>& out) const {
    Aabb3 region = grid.bounds();
    region.grow(margin);
    std::vector<const Capsule*> near;
    for (const auto& c : capsules_) {
        if (c.box.intersects(region)) {
            near.push_back(&c);
        }
    }

    out.assign(CHUNK_SAMPLES, DEFAULT_SDF_VALUE);
    if (near.empty()) {
        return;
    }
    for (int64_t k = 0; k < PADDED_CHUNK_SIDE; ++k) {
        for (int64_t j = 0; j < PADDED_CHUNK_SIDE; ++j) {
            for (int64_t i = 0; i < PADDED_CHUNK_SIDE; ++i) {
                Vec3 p = grid.sample_position(i, j, k);
                float d = DEFAULT_SDF_VALUE;
                for (const Capsule* c : near) {
                    d = std::min(d, capsule_distance(*c, p));
                }
                out[sample_index(i, j, k)] = d;
            }
        }
    }
}

MeshField::MeshField(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& triangles) {
    triangles_.reserve(triangles.size() / 3);
    for (size_t t = 0; t + 2 < triangles.size(); t += 3) {
        Triangle tri{vertices[triangles[t]], vertices[triangles[t + 1]], vertices[triangles[t + 2]], {}};
        tri.box.expand(tri.a);
        tri.box.expand(tri.b);
        tri.box.expand(tri.c);
        bounds_.merge(tri.box);
        triangles_.push_back(tri);
    }
    if (triangles_.empty()) {
        return;
    }

    auto per_side = static_cast<size_t>(std::sqrt(static_cast<double>(triangles_.size()) / 2.0));
    bins_x_ = std::clamp<size_t>(per_side, 1, 256);
    bins_y_ = bins_x_;
    Vec3 size = bounds_.size();
    bin_w_ = std::max(size.x / static_cast<float>(bins_x_), 1e-6f);
    bin_h_ = std::max(size.y / static_cast<float>(bins_y_), 1e-6f);
    bins_.assign(bins_x_ * bins_y_, {});

    auto bin_of = [](float v, float lo, float w, size_t n) {
        auto b = static_cast<int64_t>(std::floor((v - lo) / w));
        return static_cast<size_t>(std::clamp<int64_t>(b, 0, static_cast<int64_t>(n) - 1));
    };
    for (size_t t = 0; t < triangles_.size(); ++t) {
        const Aabb3& box = triangles_[t].box;
        size_t x0 = bin_of(box.min.x, bounds_.min.x, bin_w_, bins_x_);
        size_t x1 = bin_of(box.max.x, bounds_.min.x, bin_w_, bins_x_);
        size_t y0 = bin_of(box.min.y, bounds_.min.y, bin_h_, bins_y_);
        size_t y1 = bin_of(box.max.y, bounds_.min.y, bin_h_, bins_y_);
        for (size_t by = y0; by <= y1; ++by) {
            for (size_t bx = x0; bx <= x1; ++bx) {
                bins_[by * bins_x_ + bx].push_back(static_cast<uint32_t>(t));
            }
        }
    }
}

std::vector<float> MeshField::column_crossings(float x, float y) const {
    std::vector<float> crossings;
    if (triangles_.empty() || !bounds_.contains_xy(x, y)) {
        return crossings;
    }
    auto bx = std::min(static_cast<size_t>((x - bounds_.min.x) / bin_w_), bins_x_ - 1);
    auto by = std::min(static_cast<size_t>((y - bounds_.min.y) / bin_h_), bins_y_ - 1);

    const double qx = x;
    const double qy = y;
    for (uint32_t t : bins_[by * bins_x_ + bx]) {
        const Triangle& tri = triangles_[t];
        Vec2 a(tri.a.x, tri.a.y);
        Vec2 b(tri.b.x, tri.b.y);
        Vec2 c(tri.c.x, tri.c.y);
        float za = tri.a.z;
        float zb = tri.b.z;
        float zc = tri.c.z;
        double area = (b - a).cross(c - a);
        if (area == 0.0) {
            continue;
        }
        if (area < 0.0) {
            std::swap(b, c);
            std::swap(zb, zc);
            area = -area;
        }

        // Points on a shared edge belong to exactly one of the two triangles
        auto edge_weight = [&](const Vec2& p0, const Vec2& p1, bool& covered) {
            double w = (p1.x - p0.x) * (qy - p0.y) - (p1.y - p0.y) * (qx - p0.x);
            if (w == 0.0) {
                double dx = p1.x - p0.x;
                double dy = p1.y - p0.y;
                covered = covered && (dy < 0.0 || (dy == 0.0 && dx < 0.0));
            } else {
                covered = covered && w > 0.0;
            }
            return w;
        };
        bool covered = true;
        double wa = edge_weight(b, c, covered);
        double wb = edge_weight(c, a, covered);
        double wc = edge_weight(a, b, covered);
        if (!covered) {
            continue;
        }
        crossings.push_back(static_cast<float>((wa * za + wb * zb + wc * zc) / area));
    }
    std::sort(crossings.begin(), crossings.end());
    return crossings;
}

int MeshField::inside_count(const std::vector<float>& crossings, float z) {
    return static_cast<int>(crossings.end() - std::upper_bound(crossings.begin(), crossings.end(), z));
}

float MeshField::distance(const Vec3& p) const {
    float d = DEFAULT_SDF_VALUE;
    for (const auto& tri : triangles_) {
        d = std::min(d, point_triangle_distance(p, tri.a, tri.b, tri.c));
    }
    bool inside = inside_count(column_crossings(p.x, p.y), p.z) % 2 == 1;
    return inside ? -d : d;
}

void MeshField::sample_chunk(const ChunkGrid& grid, float margin, std::vector<float>& out) const {
    Aabb3 region = grid.bounds();
    region.grow(margin);
    std::vector<const Triangle*> near;
    for (const auto& tri : triangles_) {
        if (tri.box.intersects(region)) {
            near.push_back(&tri);
        }
    }

    out.assign(CHUNK_SAMPLES, DEFAULT_SDF_VALUE);
    for (int64_t j = 0; j < PADDED_CHUNK_SIDE; ++j) {
        for (int64_t i = 0; i < PADDED_CHUNK_SIDE; ++i) {
            Vec3 column = grid.sample_position(i, j, 0);
            std::vector<float> crossings = column_crossings(column.x, column.y);
            for (int64_t k = 0; k < PADDED_CHUNK_SIDE; ++k) {
                Vec3 p = grid.sample_position(i, j, k);
                float d = DEFAULT_SDF_VALUE;
                for (const Triangle* tri : near) {
                    d = std::min(d, point_triangle_distance(p, tri->a, tri->b, tri->c));
                }
                bool inside = inside_count(crossings, p.z) % 2 == 1;
                out[sample_index(i, j, k)] = inside ? -d : d;
            }
        }
    }
}

}  // namespace geomill::sdf
