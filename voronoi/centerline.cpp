#include "centerline.hpp"
#include <voronoi/planar_frame.hpp>
#include <voronoi/segment_voronoi.hpp>
#include <geometry/polyline.hpp>
#include <common/error.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <numbers>
#include <set>

namespace geomill::voronoi {

namespace {

// Grid used for the plain diagram; centerline takes it from its parameters
constexpr double DIAGRAM_GRID = 200000.0;
// Weld resolution in grid units (1/16 of a unit)
constexpr double WELD_SCALE = 16.0;
// Distance (grid units) under which an edge end counts as touching the outline
constexpr double TOUCH_DISTANCE = 1.0;

using WeldKey = std::pair<int64_t, int64_t>;

WeldKey weld_key(const Vec2& p) {
    return {std::llround(p.x * WELD_SCALE), std::llround(p.y * WELD_SCALE)};
}

Vec2 to_vec2(const IntPoint& p) {
    return {static_cast<double>(p.x), static_cast<double>(p.y)};
}

// Planar edge graph with welded vertices, in grid coordinates
struct PlanarGraph {
    std::vector<Vec2> points;
    std::vector<uint32_t> edges;
    std::map<WeldKey, uint32_t> lookup;
    std::set<std::pair<uint32_t, uint32_t>> seen;

    uint32_t vertex(const Vec2& p) {
        auto [it, inserted] = lookup.emplace(weld_key(p), static_cast<uint32_t>(points.size()));
        if (inserted) {
            points.push_back(p);
        }
        return it->second;
    }

    void add_polyline(const std::vector<Vec2>& polyline) {
        for (size_t i = 0; i + 1 < polyline.size(); ++i) {
            add_edge(vertex(polyline[i]), vertex(polyline[i + 1]));
        }
    }

    void add_edge(uint32_t a, uint32_t b) {
        if (a == b) {
            return;
        }
        if (seen.insert(std::minmax(a, b)).second) {
            edges.push_back(a);
            edges.push_back(b);
        }
    }
};

// Writes graph vertices into `out`, reusing input vertex ids where
// `input_ids` has an exact grid match. Returns the id for each graph vertex.
std::vector<uint32_t> emit_vertices(const PlanarGraph& graph, const PlanarFrame& frame,
                                    const std::map<IntPoint, uint32_t>* input_ids,
                                    GeometryBuffer& out) {
    std::vector<uint32_t> ids(graph.points.size());
    for (size_t i = 0; i < graph.points.size(); ++i) {
        const Vec2& p = graph.points[i];
        if (input_ids) {
            IntPoint q{static_cast<int32_t>(std::lround(p.x)), static_cast<int32_t>(std::lround(p.y))};
            auto it = input_ids->find(q);
            if (it != input_ids->end() && std::abs(p.x - q.x) < 1e-3 && std::abs(p.y - q.y) < 1e-3) {
                ids[i] = it->second;
                continue;
            }
        }
        ids[i] = out.add_vertex(frame.to_world(p));
    }
    return ids;
}

void copy_input(const Model& model, GeometryBuffer& out) {
    for (const auto& v : model.vertices) {
        out.add_vertex(v);
    }
    out.indices.insert(out.indices.end(), model.indices.begin(), model.indices.end());
}

Vec2 midpoint(const std::vector<Vec2>& polyline) {
    if (polyline.size() == 2) {
        return (polyline[0] + polyline[1]) * 0.5;
    }
    return polyline[polyline.size() / 2];
}

// Acute angle in degrees between the edge's first/last leg and the segment
double touch_angle(const Vec2& from, const Vec2& to, const IntSegment& seg) {
    Vec2 e = to - from;
    Vec2 d = to_vec2(seg.b) - to_vec2(seg.a);
    double denom = e.length() * d.length();
    if (denom <= 0.0) {
        return 90.0;
    }
    double c = std::clamp(std::abs(e.dot(d)) / denom, 0.0, 1.0);
    return std::acos(c) * 180.0 / std::numbers::pi;
}

bool below_angle(const VoronoiEdge& edge, const std::vector<IntSegment>& segments, double angle) {
    const auto& line = edge.polyline;
    for (const CellSource* side : {&edge.left, &edge.right}) {
        if (side->kind != CellSource::Kind::Segment) {
            continue;
        }
        const IntSegment& seg = segments[side->index];
        Vec2 a = to_vec2(seg.a);
        Vec2 b = to_vec2(seg.b);
        if (distance_to_segment(line.front(), a, b) < TOUCH_DISTANCE &&
            touch_angle(line[0], line[1], seg) < angle) {
            return true;
        }
        if (distance_to_segment(line.back(), a, b) < TOUCH_DISTANCE &&
            touch_angle(line[line.size() - 1], line[line.size() - 2], seg) < angle) {
            return true;
        }
    }
    return false;
}

// Liang-Barsky; returns false when the segment misses the box
bool clip_segment(Vec2& a, Vec2& b, const Vec2& lo, const Vec2& hi) {
    double t0 = 0.0;
    double t1 = 1.0;
    Vec2 d = b - a;
    const double p[4] = {-d.x, d.x, -d.y, d.y};
    const double q[4] = {a.x - lo.x, hi.x - a.x, a.y - lo.y, hi.y - a.y};
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;
            continue;
        }
        double t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) return false;
    }
    Vec2 start = a + d * t0;
    b = a + d * t1;
    a = start;
    return true;
}

}  // namespace

GeometryBuffer compute_centerline(const Model& model, const CenterlineParams& params) {
    auto log = logging::get_logger();

    if (model.indices.empty() || model.indices.size() % 2 != 0) {
        throw ExecutionError("centerline: input must be a non-empty edge list (index pairs)");
    }
    PlanarFrame frame = PlanarFrame::fit(model.vertices, params.max_voronoi_dimension);
    log->debug("centerline: input in {} plane, grid scale {}", to_string(frame.plane()), frame.scale());

    std::vector<IntPoint> grid(model.vertices.size());
    for (size_t i = 0; i < model.vertices.size(); ++i) {
        grid[i] = frame.to_grid(model.vertices[i]);
    }

    std::vector<IntSegment> raw;
    raw.reserve(model.indices.size() / 2);
    for (size_t i = 0; i + 1 < model.indices.size(); i += 2) {
        raw.push_back({grid[model.indices[i]], grid[model.indices[i + 1]]});
    }
    std::vector<IntSegment> segments = unique_segments(raw);
    if (segments.empty()) {
        throw ExecutionError("centerline: all input edges collapse to points");
    }

    // Closed loops decide what is inside
    std::vector<std::vector<Vec2>> rings;
    for (const auto& chain : chain_edges(model.indices, model.vertices.size())) {
        if (!is_closed(chain)) {
            continue;
        }
        std::vector<Vec2> ring;
        for (size_t i = 0; i + 1 < chain.size(); ++i) {
            ring.push_back(to_vec2(grid[chain[i]]));
        }
        rings.push_back(std::move(ring));
    }
    Vec2 grid_lo(0.0, 0.0);
    Vec2 grid_hi(0.0, 0.0);
    for (const auto& p : grid) {
        grid_hi.x = std::max(grid_hi.x, static_cast<double>(p.x));
        grid_hi.y = std::max(grid_hi.y, static_cast<double>(p.y));
    }

    double step = std::max(1.0, frame.to_grid_distance(params.tolerance));
    std::vector<VoronoiEdge> edges = build_edges({}, segments, step);

    PlanarGraph skeleton;
    size_t dropped_by_angle = 0;
    for (const auto& edge : edges) {
        if (!edge.primary) {
            continue;
        }
        if (!rings.empty()) {
            if (!inside_rings(midpoint(edge.polyline), rings)) {
                continue;
            }
        } else {
            bool inside = std::all_of(edge.polyline.begin(), edge.polyline.end(), [&](const Vec2& p) {
                return p.x >= grid_lo.x && p.x <= grid_hi.x && p.y >= grid_lo.y && p.y <= grid_hi.y;
            });
            if (!inside) {
                continue;
            }
        }
        if (params.angle > 0.0 && below_angle(edge, segments, params.angle)) {
            ++dropped_by_angle;
            continue;
        }
        skeleton.add_polyline(edge.polyline);
    }

    // Simplify each chained skeleton branch
    PlanarGraph simplified;
    for (const auto& chain : chain_edges(skeleton.edges, skeleton.points.size())) {
        std::vector<Vec2> points;
        points.reserve(chain.size());
        for (uint32_t id : chain) {
            points.push_back(skeleton.points[id]);
        }
        std::vector<size_t> kept = simplify_rdp(points, step);
        for (size_t i = 0; i + 1 < kept.size(); ++i) {
            simplified.add_edge(simplified.vertex(points[kept[i]]), simplified.vertex(points[kept[i + 1]]));
        }
    }

    GeometryBuffer out;
    std::map<IntPoint, uint32_t> input_ids;
    bool weld = params.keep_input && params.weld;
    if (params.keep_input) {
        copy_input(model, out);
        if (weld) {
            for (size_t i = 0; i < grid.size(); ++i) {
                input_ids.emplace(grid[i], static_cast<uint32_t>(i));
            }
        }
    }
    std::vector<uint32_t> ids = emit_vertices(simplified, frame, weld ? &input_ids : nullptr, out);
    for (size_t i = 0; i + 1 < simplified.edges.size(); i += 2) {
        out.add_edge(ids[simplified.edges[i]], ids[simplified.edges[i + 1]]);
    }

    log->debug("centerline: {} voronoi edges, {} skeleton edges, {} after simplification, {} dropped by angle",
               edges.size(), skeleton.edges.size() / 2, simplified.edges.size() / 2, dropped_by_angle);
    return out;
}

GeometryBuffer compute_voronoi_diagram(const Model& model, const DiagramParams& params) {
    if (model.indices.size() % 2 != 0) {
        throw ExecutionError("voronoi_diagram: edge list has an odd number of indices");
    }
    PlanarFrame frame = PlanarFrame::fit(model.vertices, DIAGRAM_GRID);

    std::vector<IntPoint> grid(model.vertices.size());
    for (size_t i = 0; i < model.vertices.size(); ++i) {
        grid[i] = frame.to_grid(model.vertices[i]);
    }

    std::vector<IntSegment> raw;
    std::vector<bool> on_edge(model.vertices.size(), false);
    for (size_t i = 0; i + 1 < model.indices.size(); i += 2) {
        raw.push_back({grid[model.indices[i]], grid[model.indices[i + 1]]});
        on_edge[model.indices[i]] = true;
        on_edge[model.indices[i + 1]] = true;
    }
    std::vector<IntSegment> segments = unique_segments(raw);

    // Loose vertices become point sites unless they sit on a segment end
    std::set<IntPoint> taken;
    for (const auto& s : segments) {
        taken.insert(s.a);
        taken.insert(s.b);
    }
    std::vector<IntPoint> points;
    for (size_t i = 0; i < grid.size(); ++i) {
        if (!on_edge[i] && taken.insert(grid[i]).second) {
            points.push_back(grid[i]);
        }
    }
    if (taken.size() < 2) {
        throw ExecutionError("voronoi_diagram: need at least two distinct input sites");
    }

    Vec2 hi(0.0, 0.0);
    for (const auto& p : grid) {
        hi.x = std::max(hi.x, static_cast<double>(p.x));
        hi.y = std::max(hi.y, static_cast<double>(p.y));
    }
    double margin = 0.1 * std::max(hi.x, hi.y);
    Vec2 box_lo(-margin, -margin);
    Vec2 box_hi(hi.x + margin, hi.y + margin);

    double step = params.tolerance > 0.0 ? frame.to_grid_distance(params.tolerance)
                                         : 0.01 * DIAGRAM_GRID;
    step = std::max(1.0, step);

    PlanarGraph diagram;
    // Rays long enough to cross the whole clip box
    double ray_length = 4.0 * (std::max(hi.x, hi.y) + margin);
    for (const auto& edge : build_edges(points, segments, step, ray_length)) {
        if (!edge.primary) {
            continue;
        }
        for (size_t i = 0; i + 1 < edge.polyline.size(); ++i) {
            Vec2 a = edge.polyline[i];
            Vec2 b = edge.polyline[i + 1];
            if (clip_segment(a, b, box_lo, box_hi)) {
                diagram.add_edge(diagram.vertex(a), diagram.vertex(b));
            }
        }
    }

    GeometryBuffer out;
    if (params.keep_input) {
        copy_input(model, out);
    }
    std::vector<uint32_t> ids = emit_vertices(diagram, frame, nullptr, out);
    for (size_t i = 0; i + 1 < diagram.edges.size(); i += 2) {
        out.add_edge(ids[diagram.edges[i]], ids[diagram.edges[i + 1]]);
    }
    return out;
}

}  // namespace geomill::voronoi
