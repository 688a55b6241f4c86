#include "geometry_buffer.hpp"
#include <common/error.hpp>
#include <fmt/format.h>
#include <limits>

namespace geomill {

uint32_t GeometryBuffer::add_vertex(const Vec3& v) {
    if (vertices.size() >= std::numeric_limits<uint32_t>::max()) {
        throw ExecutionError("vertex count exceeds the 32-bit index range");
    }
    vertices.push_back(v);
    return static_cast<uint32_t>(vertices.size() - 1);
}

void GeometryBuffer::add_matrix(const Mat4& matrix) {
    matrices.insert(matrices.end(), matrix.m.begin(), matrix.m.end());
}

Mat4 GeometryBuffer::matrix(size_t i) const {
    return Mat4::from_values(matrices.data() + i * MATRIX_FLOATS);
}

void GeometryBuffer::append(const GeometryBuffer& other) {
    if (vertices.size() + other.vertices.size() > std::numeric_limits<uint32_t>::max()) {
        throw ExecutionError("vertex count exceeds the 32-bit index range");
    }
    auto offset = static_cast<uint32_t>(vertices.size());
    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());
    indices.reserve(indices.size() + other.indices.size());
    for (uint32_t idx : other.indices) {
        indices.push_back(idx + offset);
    }
    matrices.insert(matrices.end(), other.matrices.begin(), other.matrices.end());
}

std::optional<std::string> GeometryBuffer::find_violation(bool require_finite) const {
    if (matrices.size() % MATRIX_FLOATS != 0) {
        return fmt::format("matrix count {} is not a multiple of {}", matrices.size(), MATRIX_FLOATS);
    }
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] >= vertices.size()) {
            return fmt::format("index {} at position {} references a missing vertex (vertex count {})",
                               indices[i], i, vertices.size());
        }
    }
    if (require_finite) {
        for (size_t i = 0; i < vertices.size(); ++i) {
            if (!vertices[i].is_finite()) {
                return fmt::format("vertex {} is not finite", i);
            }
        }
    }
    return std::nullopt;
}

}  // namespace geomill
