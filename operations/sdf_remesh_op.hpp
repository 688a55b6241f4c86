#ifndef GEOMILL_OPERATIONS_SDF_REMESH_OP_HPP
#define GEOMILL_OPERATIONS_SDF_REMESH_OP_HPP

#include <operations/operation_result.hpp>
#include <geometry/mesh_format.hpp>
#include <optional>

namespace geomill {

struct SdfRemeshParams {
    int resolution = 0;  // voxels along the longest side
    float iso_value = 0.0f;
    std::optional<float> radius;  // capsule/sphere radius for edges and points
    bool debug_chunks = false;
};

// command=sdf_remesh
//   resolution    required, 1..1000
//   iso_value     default 0
//   radius        > 0, default 2% of the longest side
//   debug_chunks  default false
//
// Triangle meshes are remeshed through their signed distance; edge lists and
// point clouds are thickened into capsules and spheres of `radius`.
struct SdfRemeshOp {
    static constexpr const char* NAME = "sdf_remesh";

    static SdfRemeshParams parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

// Declared format, or a guess from the index count
MeshFormat input_format(const ConfigMap& config, size_t index_count);

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_SDF_REMESH_OP_HPP
