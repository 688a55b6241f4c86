#ifndef GEOMILL_VORONOI_CENTERLINE_HPP
#define GEOMILL_VORONOI_CENTERLINE_HPP

#include <geometry/geometry_buffer.hpp>
#include <geometry/model.hpp>

namespace geomill::voronoi {

struct CenterlineParams {
    // World units; used for RDP and for sampling parabolic arcs
    double tolerance = 0.01;
    // Boundary-touching edges closer than this to their source segment
    // (degrees) are removed
    double angle = 0.0;
    bool keep_input = true;
    bool weld = true;
    double max_voronoi_dimension = 200000.0;
};

// Medial-axis style skeleton of a planar edge outline. Closed loops keep the
// edges inside them (even-odd); purely open input keeps edges inside its
// bounding box. Output is an edge list (index pairs).
GeometryBuffer compute_centerline(const Model& model, const CenterlineParams& params);

struct DiagramParams {
    // World units; zero selects 1% of the longest side
    double tolerance = 0.0;
    bool keep_input = false;
};

// Plain Voronoi diagram of the model's loose points and edges, clipped to
// the input bounding box grown by 10% per side.
GeometryBuffer compute_voronoi_diagram(const Model& model, const DiagramParams& params);

}  // namespace geomill::voronoi

#endif // GEOMILL_VORONOI_CENTERLINE_HPP
