#ifndef GEOMILL_GEOMETRY_POLYLINE_HPP
#define GEOMILL_GEOMETRY_POLYLINE_HPP

#include <math/vec3.hpp>
#include <cstdint>
#include <vector>

namespace geomill {

// Vertex ids of one chained polyline; a closed loop repeats its first id at the end
using Chain = std::vector<uint32_t>;

inline bool is_closed(const Chain& chain) {
    return chain.size() > 2 && chain.front() == chain.back();
}

// Chains an edge list (index pairs) into polylines. Vertices whose degree is
// not 2 terminate chains; what remains afterwards is returned as closed
// loops. Output order depends only on the input.
std::vector<Chain> chain_edges(const std::vector<uint32_t>& edges, size_t vertex_count);

// Ramer-Douglas-Peucker. Returns the positions (into `points`) that survive;
// the first and last point always survive. With `use_3d` false, distances
// are measured in the XY plane.
std::vector<size_t> simplify_rdp(const std::vector<Vec3>& points, double epsilon, bool use_3d);

// Same algorithm on planar points
std::vector<size_t> simplify_rdp(const std::vector<Vec2>& points, double epsilon);

// Andrew's monotone chain in XY. Returns positions of the hull vertices in
// counter-clockwise order, collinear points dropped.
std::vector<size_t> convex_hull_xy(const std::vector<Vec3>& points);

// Boundary of a triangle list: the edges that belong to exactly one
// triangle, as index pairs in order of first appearance and with the
// winding of that triangle. Triangles must not repeat a vertex.
std::vector<uint32_t> outline_edges(const std::vector<uint32_t>& triangles);

// Number of equal pieces a segment of `length` is cut into so that none is
// longer than `max_length`
size_t segment_pieces(double length, double max_length);

// Even-odd test against a set of closed rings (first point not repeated)
bool inside_rings(const Vec2& p, const std::vector<std::vector<Vec2>>& rings);

double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b);

}  // namespace geomill

#endif // GEOMILL_GEOMETRY_POLYLINE_HPP
