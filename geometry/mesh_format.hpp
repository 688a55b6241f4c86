#ifndef GEOMILL_GEOMETRY_MESH_FORMAT_HPP
#define GEOMILL_GEOMETRY_MESH_FORMAT_HPP

#include <config/config_map.hpp>
#include <optional>
#include <string>

namespace geomill {

// How a command packs its indices, written to the `mesh.format` key
enum class MeshFormat {
    Triangulated,  // index triples
    LineChunks,    // index pairs
    Line,          // one continuous index walk
    PointCloud     // no indices
};

const char* to_string(MeshFormat format);

// Reads `mesh.format`; unknown values throw ValidationError. "edges" is
// accepted as another name for line_chunks.
std::optional<MeshFormat> declared_format(const ConfigMap& config);

void set_format(ConfigMap& config, MeshFormat format);

}  // namespace geomill

#endif // GEOMILL_GEOMETRY_MESH_FORMAT_HPP
