#include "polyline.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace geomill {

namespace {

struct Adjacency {
    // (neighbor, edge id) per vertex
    std::vector<std::vector<std::pair<uint32_t, size_t>>> links;

    Adjacency(const std::vector<uint32_t>& edges, size_t vertex_count) : links(vertex_count) {
        for (size_t e = 0; e + 1 < edges.size(); e += 2) {
            uint32_t a = edges[e];
            uint32_t b = edges[e + 1];
            if (a == b) {
                continue;
            }
            links[a].emplace_back(b, e / 2);
            links[b].emplace_back(a, e / 2);
        }
    }
};

Chain walk(uint32_t start, const Adjacency& adj, std::vector<bool>& used, bool stop_at_junction) {
    Chain chain{start};
    uint32_t current = start;
    for (;;) {
        bool advanced = false;
        for (const auto& [next, edge] : adj.links[current]) {
            if (used[edge]) {
                continue;
            }
            used[edge] = true;
            chain.push_back(next);
            current = next;
            advanced = true;
            break;
        }
        if (!advanced || current == start) {
            break;
        }
        if (stop_at_junction && adj.links[current].size() != 2) {
            break;
        }
    }
    return chain;
}

template <typename Distance>
void rdp_recurse(size_t first, size_t last, double epsilon, const Distance& distance,
                 std::vector<bool>& keep) {
    if (last <= first + 1) {
        return;
    }
    double max_dist = -1.0;
    size_t split = first;
    for (size_t i = first + 1; i < last; ++i) {
        double d = distance(i, first, last);
        if (d > max_dist) {
            max_dist = d;
            split = i;
        }
    }
    if (max_dist > epsilon) {
        keep[split] = true;
        rdp_recurse(first, split, epsilon, distance, keep);
        rdp_recurse(split, last, epsilon, distance, keep);
    }
}

double distance_to_segment_3d(const Vec3& p, const Vec3& a, const Vec3& b) {
    Vec3 ab = b - a;
    float len2 = ab.length_squared();
    if (len2 <= 0.0f) {
        return p.distance_to(a);
    }
    float t = std::clamp((p - a).dot(ab) / len2, 0.0f, 1.0f);
    return p.distance_to(a + ab * t);
}

std::vector<size_t> kept_positions(const std::vector<bool>& keep) {
    std::vector<size_t> result;
    for (size_t i = 0; i < keep.size(); ++i) {
        if (keep[i]) {
            result.push_back(i);
        }
    }
    return result;
}

}  // namespace

std::vector<Chain> chain_edges(const std::vector<uint32_t>& edges, size_t vertex_count) {
    Adjacency adj(edges, vertex_count);
    std::vector<bool> used(edges.size() / 2, false);
    std::vector<Chain> chains;

    // Open chains start at ends and junctions
    for (uint32_t v = 0; v < vertex_count; ++v) {
        if (adj.links[v].size() == 2) {
            continue;
        }
        for (size_t k = 0; k < adj.links[v].size(); ++k) {
            Chain chain = walk(v, adj, used, true);
            if (chain.size() > 1) {
                chains.push_back(std::move(chain));
            }
        }
    }

    // Anything left is made of pure cycles
    for (uint32_t v = 0; v < vertex_count; ++v) {
        Chain chain = walk(v, adj, used, false);
        if (chain.size() > 1) {
            chains.push_back(std::move(chain));
        }
    }
    return chains;
}

std::vector<size_t> simplify_rdp(const std::vector<Vec3>& points, double epsilon, bool use_3d) {
    if (points.size() < 3) {
        std::vector<size_t> all(points.size());
        std::iota(all.begin(), all.end(), 0);
        return all;
    }
    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;

    if (use_3d) {
        auto distance = [&](size_t i, size_t a, size_t b) {
            return distance_to_segment_3d(points[i], points[a], points[b]);
        };
        rdp_recurse(0, points.size() - 1, epsilon, distance, keep);
    } else {
        auto distance = [&](size_t i, size_t a, size_t b) {
            return distance_to_segment(Vec2(points[i].x, points[i].y),
                                       Vec2(points[a].x, points[a].y),
                                       Vec2(points[b].x, points[b].y));
        };
        rdp_recurse(0, points.size() - 1, epsilon, distance, keep);
    }
    return kept_positions(keep);
}

std::vector<size_t> simplify_rdp(const std::vector<Vec2>& points, double epsilon) {
    if (points.size() < 3) {
        std::vector<size_t> all(points.size());
        std::iota(all.begin(), all.end(), 0);
        return all;
    }
    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;
    auto distance = [&](size_t i, size_t a, size_t b) {
        return distance_to_segment(points[i], points[a], points[b]);
    };
    rdp_recurse(0, points.size() - 1, epsilon, distance, keep);
    return kept_positions(keep);
}

std::vector<size_t> convex_hull_xy(const std::vector<Vec3>& points) {
    std::vector<size_t> order(points.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (points[a].x != points[b].x) return points[a].x < points[b].x;
        if (points[a].y != points[b].y) return points[a].y < points[b].y;
        return a < b;
    });
    order.erase(std::unique(order.begin(), order.end(), [&](size_t a, size_t b) {
        return points[a].x == points[b].x && points[a].y == points[b].y;
    }), order.end());

    if (order.size() < 3) {
        return order;
    }

    auto turn = [&](size_t o, size_t a, size_t b) {
        Vec2 oa(double(points[a].x) - points[o].x, double(points[a].y) - points[o].y);
        Vec2 ob(double(points[b].x) - points[o].x, double(points[b].y) - points[o].y);
        return oa.cross(ob);
    };

    std::vector<size_t> hull(2 * order.size());
    size_t k = 0;
    for (size_t i = 0; i < order.size(); ++i) {
        while (k >= 2 && turn(hull[k - 2], hull[k - 1], order[i]) <= 0.0) --k;
        hull[k++] = order[i];
    }
    for (size_t i = order.size() - 1, lower = k + 1; i-- > 0;) {
        while (k >= lower && turn(hull[k - 2], hull[k - 1], order[i]) <= 0.0) --k;
        hull[k++] = order[i];
    }
    hull.resize(k - 1);
    return hull;
}

std::vector<uint32_t> outline_edges(const std::vector<uint32_t>& triangles) {
    // Undirected edge to (use count, first directed occurrence)
    std::map<std::pair<uint32_t, uint32_t>, std::pair<int, size_t>> uses;
    std::vector<std::pair<uint32_t, uint32_t>> directed;
    for (size_t t = 0; t + 2 < triangles.size(); t += 3) {
        for (int k = 0; k < 3; ++k) {
            uint32_t a = triangles[t + k];
            uint32_t b = triangles[t + (k + 1) % 3];
            std::pair<uint32_t, uint32_t> key = std::minmax(a, b);
            auto [it, inserted] = uses.try_emplace(key, 0, directed.size());
            if (inserted) {
                directed.emplace_back(a, b);
            }
            ++it->second.first;
        }
    }

    std::vector<size_t> boundary;
    for (const auto& [key, use] : uses) {
        if (use.first == 1) {
            boundary.push_back(use.second);
        }
    }
    std::sort(boundary.begin(), boundary.end());

    std::vector<uint32_t> edges;
    edges.reserve(boundary.size() * 2);
    for (size_t e : boundary) {
        edges.push_back(directed[e].first);
        edges.push_back(directed[e].second);
    }
    return edges;
}

size_t segment_pieces(double length, double max_length) {
    if (!(length > max_length)) {
        return 1;
    }
    return static_cast<size_t>(std::ceil(length / max_length));
}

bool inside_rings(const Vec2& p, const std::vector<std::vector<Vec2>>& rings) {
    bool inside = false;
    for (const auto& ring : rings) {
        size_t n = ring.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const Vec2& a = ring[i];
            const Vec2& b = ring[j];
            if ((a.y > p.y) != (b.y > p.y) &&
                p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    double len2 = ab.dot(ab);
    if (len2 <= 0.0) {
        return (p - a).length();
    }
    double t = std::clamp((p - a).dot(ab) / len2, 0.0, 1.0);
    return (p - (a + ab * t)).length();
}

}  // namespace geomill
