#include "toolpath_op.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <config/config_options.hpp>
#include <geometry/mesh_format.hpp>
#include <geometry/model.hpp>
#include <math/aabb.hpp>

namespace geomill {

ToolpathParams ToolpathOp::parse(const ConfigMap& config) {
    ToolpathParams params;
    params.tool_diameter = options::to_float("tool_diameter", options::get_float(config, "tool_diameter"));
    options::check_positive("tool_diameter", params.tool_diameter);

    double step_over = options::get_float(config, "step_over");
    if (!(step_over > 0.0) || step_over > 1.0) {
        throw ValidationError("step_over", "step_over must be in (0, 1]");
    }
    params.step_over = static_cast<float>(step_over);

    std::string strategy = options::get_enum(config, "strategy", {"meander", "raster"});
    params.strategy = strategy == "raster" ? toolpath::Strategy::Raster : toolpath::Strategy::Meander;

    std::string probe = options::get_enum(config, "probe", {"ball_nose", "square_end"}, "ball_nose");
    params.probe = probe == "square_end" ? toolpath::ProbeShape::SquareEnd : toolpath::ProbeShape::BallNose;

    if (config.has("sample_distance")) {
        float d = options::to_float("sample_distance", options::get_float(config, "sample_distance"));
        options::check_positive("sample_distance", d);
        params.sample_distance = d;
    }
    if (config.has("minimum_z")) {
        params.minimum_z = options::to_float("minimum_z", options::get_float(config, "minimum_z"));
    }
    if (config.has("safe_z")) {
        params.safe_z = options::to_float("safe_z", options::get_float(config, "safe_z"));
    }
    return params;
}

void ToolpathOp::validate(const ConfigMap& config) const {
    parse(config);
    auto format = declared_format(config);
    if (format && *format != MeshFormat::Triangulated) {
        throw ValidationError(keys::MESH_FORMAT,
                              std::string("mesh.format: expected triangulated, got ") + to_string(*format));
    }
}

OperationResult ToolpathOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();
    ToolpathParams params = parse(config);
    auto models = collect_models(config, input);

    const Model& part = models.front();
    if (part.indices.empty() || part.indices.size() % 3 != 0) {
        throw ExecutionError("toolpath: model 0 must be a non-empty triangle mesh");
    }
    std::vector<Vec3> part_vertices = part.world_vertices();
    for (const auto& v : part_vertices) {
        if (!v.is_finite()) {
            throw ExecutionError("toolpath: input contains a non-finite coordinate");
        }
    }

    toolpath::Probe probe{params.probe, 0.5f * params.tool_diameter};
    toolpath::DropCutter cutter(part_vertices, part.indices, probe);
    const Aabb3& part_box = cutter.bounds();

    Aabb3 area = part_box;
    if (models.size() > 1 && !models[1].empty()) {
        area = Aabb3::of(models[1].world_vertices());
        log->debug("toolpath: scan area limited by model 1");
    }

    toolpath::ScanParams scan;
    scan.strategy = params.strategy;
    scan.line_spacing = params.tool_diameter * params.step_over;
    scan.sample_distance = params.sample_distance.value_or(scan.line_spacing);
    scan.minimum_z = params.minimum_z.value_or(part_box.min.z);
    scan.safe_z = params.safe_z.value_or(part_box.max.z + params.tool_diameter);
    scan.min_x = area.min.x;
    scan.max_x = area.max.x;
    scan.min_y = area.min.y;
    scan.max_y = area.max.y;

    toolpath::ToolPath path = toolpath::generate_toolpath(cutter, scan);

    OperationResult result;
    for (const auto& p : path.points) {
        result.geometry.add_vertex(p);
    }
    for (uint32_t i = 0; i + 1 < result.geometry.vertices.size(); ++i) {
        result.geometry.add_edge(i, i + 1);
    }
    set_format(result.config, MeshFormat::LineChunks);
    result.config.set("toolpath.points", std::to_string(path.points.size()));
    result.config.set("toolpath.lines", std::to_string(path.line_count));
    return result;
}

}  // namespace geomill
