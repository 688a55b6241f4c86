#include "segment_voronoi.hpp"
#include <common/logging.hpp>
#include <boost/polygon/point_data.hpp>
#include <boost/polygon/segment_data.hpp>
#include <boost/polygon/voronoi.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace geomill::voronoi {

namespace bp = boost::polygon;

using BoostPoint = bp::point_data<int32_t>;
using BoostSegment = bp::segment_data<int32_t>;
using Diagram = bp::voronoi_diagram<double>;

namespace {

// Upper bound on samples for one parabolic arc
constexpr size_t MAX_ARC_SAMPLES = 1024;

Vec2 to_vec2(const IntPoint& p) {
    return {static_cast<double>(p.x), static_cast<double>(p.y)};
}

CellSource source_of(const Diagram::cell_type& cell, size_t point_count) {
    CellSource source;
    size_t idx = cell.source_index();
    if (idx < point_count) {
        source.kind = CellSource::Kind::Point;
        source.index = idx;
        return source;
    }
    source.index = idx - point_count;
    source.kind = cell.contains_segment() ? CellSource::Kind::Segment
                                          : CellSource::Kind::SegmentEnd;
    return source;
}

// Focus of the parabola: the point site of a point cell
Vec2 focus_of(const Diagram::cell_type& cell, const std::vector<IntPoint>& points,
              const std::vector<IntSegment>& segments) {
    size_t idx = cell.source_index();
    if (idx < points.size()) {
        return to_vec2(points[idx]);
    }
    const IntSegment& seg = segments[idx - points.size()];
    return cell.source_category() == bp::SOURCE_CATEGORY_SEGMENT_START_POINT
        ? to_vec2(seg.a) : to_vec2(seg.b);
}

// Samples the parabola equidistant from `focus` and the line through
// `segment`, between the projections of `start` and `end`.
std::vector<Vec2> sample_parabola(const Vec2& start, const Vec2& end, const Vec2& focus,
                                  const IntSegment& segment, double step) {
    Vec2 s0 = to_vec2(segment.a);
    Vec2 dir = to_vec2(segment.b) - s0;
    double len = dir.length();
    Vec2 unit = dir * (1.0 / len);
    Vec2 perp(-unit.y, unit.x);

    auto local_x = [&](const Vec2& q) { return (q - s0).dot(unit); };
    double fx = local_x(focus);
    double fy = (focus - s0).dot(perp);

    double x0 = local_x(start);
    double x1 = local_x(end);
    auto count = static_cast<size_t>(std::ceil((end - start).length() / step));
    count = std::clamp<size_t>(count, 1, MAX_ARC_SAMPLES);

    std::vector<Vec2> samples;
    samples.reserve(count + 1);
    samples.push_back(start);
    for (size_t i = 1; i < count; ++i) {
        double x = x0 + (x1 - x0) * static_cast<double>(i) / static_cast<double>(count);
        double y = ((x - fx) * (x - fx) + fy * fy) / (2.0 * fy);
        samples.push_back(s0 + unit * x + perp * y);
    }
    samples.push_back(end);
    return samples;
}

// Straight stand-in for an infinite edge. Only two point-like sites can
// share an infinite edge, so it lies on their perpendicular bisector.
std::vector<Vec2> infinite_ray(const Diagram::edge_type& edge, const std::vector<IntPoint>& points,
                               const std::vector<IntSegment>& segments, double ray_length) {
    Vec2 p1 = focus_of(*edge.cell(), points, segments);
    Vec2 p2 = focus_of(*edge.twin()->cell(), points, segments);
    Vec2 origin = (p1 + p2) * 0.5;
    // Points of cell() lie to the left of the edge direction
    Vec2 direction(p1.y - p2.y, p2.x - p1.x);
    double len = direction.length();
    if (len <= 0.0) {
        return {};
    }
    direction = direction * (ray_length / len);

    Vec2 start = edge.vertex0() ? Vec2(edge.vertex0()->x(), edge.vertex0()->y()) : origin - direction;
    Vec2 end = edge.vertex1() ? Vec2(edge.vertex1()->x(), edge.vertex1()->y()) : origin + direction;
    if (edge.vertex0() && !edge.vertex1()) {
        end = start + direction;
    } else if (!edge.vertex0() && edge.vertex1()) {
        start = end - direction;
    }
    return {start, end};
}

}  // namespace

std::vector<IntSegment> unique_segments(const std::vector<IntSegment>& segments) {
    std::set<std::pair<IntPoint, IntPoint>> seen;
    std::vector<IntSegment> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        if (seg.a == seg.b) {
            continue;
        }
        auto key = seg.a < seg.b ? std::make_pair(seg.a, seg.b) : std::make_pair(seg.b, seg.a);
        if (seen.insert(key).second) {
            result.push_back(seg);
        }
    }
    return result;
}

std::vector<VoronoiEdge> build_edges(const std::vector<IntPoint>& points,
                                     const std::vector<IntSegment>& segments,
                                     double sample_step, double ray_length) {
    auto log = logging::get_logger();

    std::vector<BoostPoint> boost_points;
    boost_points.reserve(points.size());
    for (const auto& p : points) {
        boost_points.emplace_back(p.x, p.y);
    }
    std::vector<BoostSegment> boost_segments;
    boost_segments.reserve(segments.size());
    for (const auto& s : segments) {
        boost_segments.emplace_back(BoostPoint(s.a.x, s.a.y), BoostPoint(s.b.x, s.b.y));
    }

    Diagram diagram;
    bp::construct_voronoi(boost_points.begin(), boost_points.end(),
                          boost_segments.begin(), boost_segments.end(), &diagram);
    log->debug("Voronoi diagram: {} vertices, {} edges, {} cells",
               diagram.num_vertices(), diagram.num_edges(), diagram.num_cells());

    std::vector<VoronoiEdge> edges;
    for (const auto& edge : diagram.edges()) {
        // Each edge is stored twice (once per half-edge)
        if (&edge > edge.twin()) {
            continue;
        }
        if (!edge.is_finite()) {
            if (ray_length <= 0.0 || !edge.is_primary() || edge.is_curved() ||
                edge.cell()->contains_segment() || edge.twin()->cell()->contains_segment()) {
                continue;
            }
            VoronoiEdge out;
            out.left = source_of(*edge.cell(), points.size());
            out.right = source_of(*edge.twin()->cell(), points.size());
            out.polyline = infinite_ray(edge, points, segments, ray_length);
            if (out.polyline.size() == 2) {
                edges.push_back(std::move(out));
            }
            continue;
        }
        Vec2 start(edge.vertex0()->x(), edge.vertex0()->y());
        Vec2 end(edge.vertex1()->x(), edge.vertex1()->y());

        VoronoiEdge out;
        out.primary = edge.is_primary();
        out.curved = edge.is_curved();
        out.left = source_of(*edge.cell(), points.size());
        out.right = source_of(*edge.twin()->cell(), points.size());

        if (out.curved) {
            const auto* point_cell = edge.cell();
            const auto* segment_cell = edge.twin()->cell();
            if (point_cell->contains_segment()) {
                std::swap(point_cell, segment_cell);
            }
            Vec2 focus = focus_of(*point_cell, points, segments);
            const IntSegment& directrix = segments[segment_cell->source_index() - points.size()];
            out.polyline = sample_parabola(start, end, focus, directrix, sample_step);
        } else {
            out.polyline = {start, end};
        }
        edges.push_back(std::move(out));
    }
    return edges;
}

}  // namespace geomill::voronoi
