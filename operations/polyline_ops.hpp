#ifndef GEOMILL_OPERATIONS_POLYLINE_OPS_HPP
#define GEOMILL_OPERATIONS_POLYLINE_OPS_HPP

#include <operations/operation_result.hpp>

namespace geomill {

// command=simplify_rdp
//   epsilon      required, > 0
//   simplify_3d  default false (distances measured in XY)
struct SimplifyRdpOp {
    static constexpr const char* NAME = "simplify_rdp";

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

// command=convex_hull_2d: closed XY hull loop of the input vertices
struct ConvexHull2dOp {
    static constexpr const char* NAME = "convex_hull_2d";

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

// command=2d_outline: boundary edges of a planar triangle mesh (edges shared
// by two triangles are dropped)
struct OutlineOp {
    static constexpr const char* NAME = "2d_outline";

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

// command=discretize
//   discretize_length  required, percent of the longest bounding box side, in (0, 100]
// Splits every edge so no piece is longer than that length.
struct DiscretizeOp {
    static constexpr const char* NAME = "discretize";

    static double parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_POLYLINE_OPS_HPP
