#ifndef GEOMILL_OPERATIONS_CENTERLINE_OP_HPP
#define GEOMILL_OPERATIONS_CENTERLINE_OP_HPP

#include <operations/operation_result.hpp>
#include <voronoi/centerline.hpp>

namespace geomill {

// command=centerline
//   tolerance              required, > 0
//   angle                  degrees in [0, 90], default 0
//   keep_input             default true
//   weld                   default true, ignored without keep_input
//   max_voronoi_dimension  [1000, 1e8], default 200000
struct CenterlineOp {
    static constexpr const char* NAME = "centerline";

    static voronoi::CenterlineParams parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

// command=voronoi_diagram
//   tolerance   > 0, default 1% of the input's longest side
//   keep_input  default false
struct VoronoiDiagramOp {
    static constexpr const char* NAME = "voronoi_diagram";

    static voronoi::DiagramParams parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_CENTERLINE_OP_HPP
