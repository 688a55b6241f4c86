#ifndef GEOMILL_VORONOI_SEGMENT_VORONOI_HPP
#define GEOMILL_VORONOI_SEGMENT_VORONOI_HPP

#include <voronoi/planar_frame.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <vector>

namespace geomill::voronoi {

struct IntSegment {
    IntPoint a;
    IntPoint b;
};

// Which input site a Voronoi cell belongs to
struct CellSource {
    enum class Kind { Point, SegmentEnd, Segment };
    Kind kind = Kind::Point;
    // Index into the point list for Point, into the segment list otherwise
    size_t index = 0;
};

// One finite Voronoi edge in grid coordinates. Curved edges are already
// sampled, so `polyline` always holds at least the two end vertices.
struct VoronoiEdge {
    std::vector<Vec2> polyline;
    bool primary = true;
    bool curved = false;
    CellSource left;
    CellSource right;
};

// Builds the Voronoi diagram of points and non-crossing segments given on
// the integer grid and returns every edge once. Parabolic edges are sampled
// so that consecutive samples are at most `sample_step` apart. Infinite
// edges are skipped when `ray_length` is zero, otherwise they become straight
// rays reaching `ray_length` past their finite end (or past the midpoint of
// their sites when both ends are infinite).
std::vector<VoronoiEdge> build_edges(const std::vector<IntPoint>& points,
                                     const std::vector<IntSegment>& segments,
                                     double sample_step, double ray_length = 0.0);

// Removes duplicate segments (in either direction) and zero-length ones
std::vector<IntSegment> unique_segments(const std::vector<IntSegment>& segments);

}  // namespace geomill::voronoi

#endif // GEOMILL_VORONOI_SEGMENT_VORONOI_HPP
