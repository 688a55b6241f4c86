#ifndef GEOMILL_GEOMETRY_GEOMETRY_BUFFER_HPP
#define GEOMILL_GEOMETRY_GEOMETRY_BUFFER_HPP

#include <math/vec3.hpp>
#include <math/mat4.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geomill {

constexpr size_t MATRIX_FLOATS = 16;

// Owned vertex/index/matrix triple. The meaning of `indices` (triangles,
// edge pairs, point list) is decided by the command that reads it.
struct GeometryBuffer {
    std::vector<Vec3> vertices;
    std::vector<uint32_t> indices;
    std::vector<float> matrices;

    bool empty() const { return vertices.empty() && indices.empty() && matrices.empty(); }
    size_t matrix_count() const { return matrices.size() / MATRIX_FLOATS; }

    uint32_t add_vertex(const Vec3& v);

    void add_edge(uint32_t a, uint32_t b) {
        indices.push_back(a);
        indices.push_back(b);
    }

    void add_triangle(uint32_t a, uint32_t b, uint32_t c) {
        indices.push_back(a);
        indices.push_back(b);
        indices.push_back(c);
    }

    void add_matrix(const Mat4& matrix);
    Mat4 matrix(size_t i) const;

    // Appends `other`, shifting its indices past the current vertices
    void append(const GeometryBuffer& other);

    // First broken invariant (index out of range, partial matrix), if any.
    // Host input may carry non-finite vertices; operation output may not.
    std::optional<std::string> find_violation(bool require_finite = false) const;
};

}  // namespace geomill

#endif // GEOMILL_GEOMETRY_GEOMETRY_BUFFER_HPP
