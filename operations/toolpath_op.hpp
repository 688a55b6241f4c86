#ifndef GEOMILL_OPERATIONS_TOOLPATH_OP_HPP
#define GEOMILL_OPERATIONS_TOOLPATH_OP_HPP

#include <operations/operation_result.hpp>
#include <toolpath/drop_cutter.hpp>
#include <toolpath/scan_pattern.hpp>
#include <optional>

namespace geomill {

struct ToolpathParams {
    float tool_diameter = 1.0f;
    float step_over = 0.5f;  // fraction of the diameter
    toolpath::Strategy strategy = toolpath::Strategy::Meander;
    toolpath::ProbeShape probe = toolpath::ProbeShape::BallNose;
    std::optional<float> sample_distance;
    std::optional<float> minimum_z;
    std::optional<float> safe_z;
};

// command=toolpath
//
// Model 0 is the part (triangles); an optional model 1 limits the scanned
// area to its XY bounding box. Both are taken in world space.
struct ToolpathOp {
    static constexpr const char* NAME = "toolpath";

    static ToolpathParams parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_TOOLPATH_OP_HPP
