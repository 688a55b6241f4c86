#include "mesh_format.hpp"
#include <common/error.hpp>

namespace geomill {

const char* to_string(MeshFormat format) {
    switch (format) {
        case MeshFormat::Triangulated: return "triangulated";
        case MeshFormat::LineChunks: return "line_chunks";
        case MeshFormat::Line: return "line";
        case MeshFormat::PointCloud: return "point_cloud";
    }
    return "unknown";
}

std::optional<MeshFormat> declared_format(const ConfigMap& config) {
    auto value = config.get(keys::MESH_FORMAT);
    if (!value) {
        return std::nullopt;
    }
    const std::string& v = *value;
    if (v == "triangulated") return MeshFormat::Triangulated;
    if (v == "line_chunks" || v == "edges") return MeshFormat::LineChunks;
    if (v == "line") return MeshFormat::Line;
    if (v == "point_cloud") return MeshFormat::PointCloud;
    throw ValidationError(keys::MESH_FORMAT, "mesh.format: unsupported value '" + v + "'");
}

void set_format(ConfigMap& config, MeshFormat format) {
    config.set(keys::MESH_FORMAT, to_string(format));
}

}  // namespace geomill
