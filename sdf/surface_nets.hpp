#ifndef GEOMILL_SDF_SURFACE_NETS_HPP
#define GEOMILL_SDF_SURFACE_NETS_HPP

#include <sdf/distance_field.hpp>
#include <geometry/geometry_buffer.hpp>

namespace geomill::sdf {

struct SurfaceNetsParams {
    float voxel_size = 1.0f;
    float iso_value = 0.0f;
    // Append a box per meshed chunk
    bool debug_chunks = false;
    // Refuse fields that would need more chunks than this
    size_t max_chunks = 4000000;
};

struct SurfaceNetsResult {
    GeometryBuffer mesh;  // triangle list
    size_t chunks_total = 0;
    size_t chunks_meshed = 0;
};

// Meshes the iso surface of `field` with naive surface nets on 16^3 chunks.
// Chunks are sampled and meshed in parallel and merged in chunk order, then
// coincident vertices are welded, so the output does not depend on the
// thread count.
SurfaceNetsResult mesh_field(const DistanceField& field, const SurfaceNetsParams& params);

// Surface nets for one chunk of samples (no welding). Exposed for tests.
GeometryBuffer mesh_chunk(const std::vector<float>& samples, const ChunkGrid& grid, float iso_value);

}  // namespace geomill::sdf

#endif // GEOMILL_SDF_SURFACE_NETS_HPP
