#ifndef GEOMILL_FFI_MARSHAL_HPP
#define GEOMILL_FFI_MARSHAL_HPP

#include <ffi/geomill_api.h>
#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>

namespace geomill::ffi {

// Upper bound on config entries accepted from the host
constexpr size_t MAX_CONFIG_ENTRIES = 1000;

// Copies host buffers into an owned GeometryBuffer. Throws DecodeError for a
// null pointer with a nonzero length, a matrix count that is not a multiple
// of 16, or an index outside the vertex range.
GeometryBuffer decode_geometry(const GeomillVector3* vertices, size_t vertex_count,
                               const uint32_t* indices, size_t index_count,
                               const float* matrices, size_t matrix_count);

// Copies a host string map. Throws DecodeError for a null map, null
// entries, too many entries or duplicate keys.
ConfigMap decode_config(const StringMap* config);

}  // namespace geomill::ffi

#endif // GEOMILL_FFI_MARSHAL_HPP
