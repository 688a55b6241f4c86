#include "centerline_op.hpp"
#include <config/config_options.hpp>
#include <common/error.hpp>
#include <geometry/mesh_format.hpp>
#include <geometry/model.hpp>

namespace geomill {

namespace {

void require_edges(const ConfigMap& config) {
    auto format = declared_format(config);
    if (format && *format != MeshFormat::LineChunks) {
        throw ValidationError(keys::MESH_FORMAT,
                              std::string("mesh.format: expected line_chunks, got ") + to_string(*format));
    }
}

}  // namespace

voronoi::CenterlineParams CenterlineOp::parse(const ConfigMap& config) {
    voronoi::CenterlineParams params;
    params.tolerance = options::get_float(config, "tolerance");
    options::check_positive("tolerance", params.tolerance);
    params.angle = options::get_float(config, "angle", 0.0);
    options::check_range("angle", params.angle, 0.0, 90.0);
    params.keep_input = options::get_bool(config, "keep_input", true);
    params.weld = options::get_bool(config, "weld", true) && params.keep_input;
    params.max_voronoi_dimension = options::get_float(config, "max_voronoi_dimension", 200000.0);
    options::check_range("max_voronoi_dimension", params.max_voronoi_dimension, 1000.0, 100000000.0);
    return params;
}

void CenterlineOp::validate(const ConfigMap& config) const {
    parse(config);
    require_edges(config);
}

OperationResult CenterlineOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto models = collect_models(config, input);
    OperationResult result;
    result.geometry = voronoi::compute_centerline(models.front(), parse(config));
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

voronoi::DiagramParams VoronoiDiagramOp::parse(const ConfigMap& config) {
    voronoi::DiagramParams params;
    if (config.has("tolerance")) {
        params.tolerance = options::get_float(config, "tolerance");
        options::check_positive("tolerance", params.tolerance);
    }
    params.keep_input = options::get_bool(config, "keep_input", false);
    return params;
}

void VoronoiDiagramOp::validate(const ConfigMap& config) const {
    parse(config);
    auto format = declared_format(config);
    if (format && *format == MeshFormat::Triangulated) {
        throw ValidationError(keys::MESH_FORMAT, "mesh.format: expected points or edges, got triangulated");
    }
}

OperationResult VoronoiDiagramOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto models = collect_models(config, input);
    OperationResult result;
    result.geometry = voronoi::compute_voronoi_diagram(models.front(), parse(config));
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

}  // namespace geomill
