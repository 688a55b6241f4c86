#include "marshal.hpp"
#include <common/error.hpp>
#include <fmt/format.h>

namespace geomill::ffi {

namespace {

template <typename T>
void check_buffer(const T* data, size_t count, const char* what) {
    if (data == nullptr && count != 0) {
        throw DecodeError(fmt::format("{} pointer is null but count is {}", what, count));
    }
}

}  // namespace

GeometryBuffer decode_geometry(const GeomillVector3* vertices, size_t vertex_count,
                               const uint32_t* indices, size_t index_count,
                               const float* matrices, size_t matrix_count) {
    check_buffer(vertices, vertex_count, "vertex");
    check_buffer(indices, index_count, "index");
    check_buffer(matrices, matrix_count, "matrix");
    if (matrix_count % MATRIX_FLOATS != 0) {
        throw DecodeError(fmt::format("matrix count {} is not a multiple of {}", matrix_count, MATRIX_FLOATS));
    }
    if (vertex_count > UINT32_MAX) {
        throw DecodeError(fmt::format("vertex count {} exceeds the 32-bit index range", vertex_count));
    }

    GeometryBuffer buffer;
    buffer.vertices.reserve(vertex_count);
    for (size_t i = 0; i < vertex_count; ++i) {
        buffer.vertices.emplace_back(vertices[i].x, vertices[i].y, vertices[i].z);
    }
    if (index_count > 0) {
        buffer.indices.assign(indices, indices + index_count);
    }
    if (matrix_count > 0) {
        buffer.matrices.assign(matrices, matrices + matrix_count);
    }

    if (auto violation = buffer.find_violation()) {
        throw DecodeError(*violation);
    }
    return buffer;
}

ConfigMap decode_config(const StringMap* config) {
    if (config == nullptr) {
        throw DecodeError("config map is null");
    }
    if (config->count > MAX_CONFIG_ENTRIES) {
        throw DecodeError(fmt::format("config map has {} entries, limit is {}", config->count, MAX_CONFIG_ENTRIES));
    }
    if (config->count > 0 && (config->keys == nullptr || config->values == nullptr)) {
        throw DecodeError("config map arrays are null");
    }

    ConfigMap map;
    for (size_t i = 0; i < config->count; ++i) {
        const char* key = config->keys[i];
        const char* value = config->values[i];
        if (key == nullptr || value == nullptr) {
            throw DecodeError(fmt::format("config entry {} is null", i));
        }
        if (!map.insert(key, value)) {
            throw DecodeError(fmt::format("duplicate config key: {}", key));
        }
    }
    return map;
}

}  // namespace geomill::ffi
