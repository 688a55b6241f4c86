#ifndef GEOMILL_GEOMETRY_MODEL_HPP
#define GEOMILL_GEOMETRY_MODEL_HPP

#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>
#include <math/mat4.hpp>
#include <vector>

namespace geomill {

// One object of a multi-object call. Indices are local to `vertices`.
struct Model {
    size_t index = 0;
    std::vector<Vec3> vertices;
    std::vector<uint32_t> indices;
    Mat4 world = Mat4::identity();

    bool empty() const { return vertices.empty(); }

    // Vertices with `world` applied
    std::vector<Vec3> world_vertices() const;
};

// Config key marking where model `n` begins in the vertex buffer
std::string first_vertex_key(size_t n);
// Config key marking where model `n` begins in the index buffer
std::string first_index_key(size_t n);

// Splits the buffer into models. Model 0 always exists (possibly empty);
// model N > 0 exists when first_vertex_model_N is present. Broken ranges
// throw ExecutionError.
std::vector<Model> collect_models(const ConfigMap& config, const GeometryBuffer& input);

}  // namespace geomill

#endif // GEOMILL_GEOMETRY_MODEL_HPP
