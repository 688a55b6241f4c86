#include "sdf_remesh_op.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <config/config_options.hpp>
#include <geometry/model.hpp>
#include <sdf/distance_field.hpp>
#include <sdf/surface_nets.hpp>
#include <fmt/format.h>
#include <memory>

namespace geomill {

namespace {

constexpr int MAX_RESOLUTION = 1000;
constexpr double MAX_ISO_VALUE = 1e6;
// Default thickening radius as a fraction of the longest side
constexpr float DEFAULT_RADIUS_FRACTION = 0.02f;

}  // namespace

MeshFormat input_format(const ConfigMap& config, size_t index_count) {
    if (auto declared = declared_format(config)) {
        return *declared;
    }
    if (index_count == 0) return MeshFormat::PointCloud;
    if (index_count % 3 == 0) return MeshFormat::Triangulated;
    return MeshFormat::LineChunks;
}

SdfRemeshParams SdfRemeshOp::parse(const ConfigMap& config) {
    SdfRemeshParams params;
    int64_t resolution = options::get_int(config, "resolution");
    if (resolution <= 0) {
        throw ValidationError("resolution", "resolution must be positive");
    }
    if (resolution > MAX_RESOLUTION) {
        throw ValidationError("resolution", fmt::format("resolution must not exceed {}", MAX_RESOLUTION));
    }
    params.resolution = static_cast<int>(resolution);
    double iso_value = options::get_float(config, "iso_value", 0.0);
    options::check_range("iso_value", iso_value, -MAX_ISO_VALUE, MAX_ISO_VALUE);
    params.iso_value = static_cast<float>(iso_value);
    if (config.has("radius")) {
        float radius = options::to_float("radius", options::get_float(config, "radius"));
        options::check_positive("radius", radius);
        params.radius = radius;
    }
    params.debug_chunks = options::get_bool(config, "debug_chunks", false);
    return params;
}

void SdfRemeshOp::validate(const ConfigMap& config) const {
    parse(config);
    declared_format(config);
}

OperationResult SdfRemeshOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();
    SdfRemeshParams params = parse(config);
    auto models = collect_models(config, input);
    const Model& model = models.front();
    if (model.vertices.empty()) {
        throw ExecutionError("sdf_remesh: input has no vertices");
    }
    for (const auto& v : model.vertices) {
        if (!v.is_finite()) {
            throw ExecutionError("sdf_remesh: input contains a non-finite coordinate");
        }
    }

    Aabb3 box = Aabb3::of(model.vertices);
    float longest = box.longest_side();
    MeshFormat format = input_format(config, model.indices.size());
    float radius = params.radius.value_or(DEFAULT_RADIUS_FRACTION * longest);

    if (!(radius > 0.0f) && format != MeshFormat::Triangulated) {
        throw ExecutionError("sdf_remesh: input is a single point, set radius explicitly");
    }

    std::unique_ptr<sdf::DistanceField> field;
    switch (format) {
        case MeshFormat::Triangulated: {
            if (model.indices.size() % 3 != 0) {
                throw ExecutionError("sdf_remesh: triangulated input needs index triples");
            }
            field = std::make_unique<sdf::MeshField>(model.vertices, model.indices);
            break;
        }
        case MeshFormat::LineChunks:
        case MeshFormat::Line: {
            auto capsules = std::make_unique<sdf::CapsuleField>();
            if (format == MeshFormat::LineChunks) {
                if (model.indices.size() % 2 != 0) {
                    throw ExecutionError("sdf_remesh: edge input needs index pairs");
                }
                for (size_t i = 0; i + 1 < model.indices.size(); i += 2) {
                    capsules->add_capsule(model.vertices[model.indices[i]],
                                          model.vertices[model.indices[i + 1]], radius);
                }
            } else {
                for (size_t i = 0; i + 1 < model.indices.size(); ++i) {
                    capsules->add_capsule(model.vertices[model.indices[i]],
                                          model.vertices[model.indices[i + 1]], radius);
                }
            }
            field = std::move(capsules);
            break;
        }
        case MeshFormat::PointCloud: {
            auto spheres = std::make_unique<sdf::CapsuleField>();
            for (const auto& v : model.vertices) {
                spheres->add_sphere(v, radius);
            }
            field = std::move(spheres);
            break;
        }
    }

    float extent = format == MeshFormat::Triangulated ? longest : field->bounds().longest_side();
    if (!(extent > 0.0f)) {
        throw ExecutionError("sdf_remesh: input has no extent");
    }

    sdf::SurfaceNetsParams mesher;
    mesher.voxel_size = extent / static_cast<float>(params.resolution);
    mesher.iso_value = params.iso_value;
    mesher.debug_chunks = params.debug_chunks;
    log->debug("sdf_remesh: {} input, radius {}, voxel {}", to_string(format), radius, mesher.voxel_size);

    auto meshed = sdf::mesh_field(*field, mesher);
    if (meshed.chunks_meshed == 0) {
        throw ExecutionError("sdf_remesh: the field never crosses the iso value");
    }

    OperationResult result;
    result.geometry = std::move(meshed.mesh);
    set_format(result.config, MeshFormat::Triangulated);
    result.config.set("sdf.chunks", std::to_string(meshed.chunks_meshed));
    return result;
}

}  // namespace geomill
