#include "surface_nets.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <map>
#include <string>

namespace geomill::sdf {

namespace {

constexpr uint32_t NO_VERTEX = std::numeric_limits<uint32_t>::max();
// Cells with a vertex have their min corner in [0, CELL_SIDE)
constexpr int64_t CELL_SIDE = PADDED_CHUNK_SIDE - 1;

constexpr int CUBE_EDGES[12][2] = {
    {0, 1}, {2, 3}, {4, 5}, {6, 7},  // along x
    {0, 2}, {1, 3}, {4, 6}, {5, 7},  // along y
    {0, 4}, {1, 5}, {2, 6}, {3, 7}   // along z
};

Vec3 corner_offset(int corner) {
    return {static_cast<float>(corner & 1), static_cast<float>((corner >> 1) & 1),
            static_cast<float>((corner >> 2) & 1)};
}

bool has_sign_change(const std::vector<float>& samples, float iso) {
    bool any_inside = false;
    bool any_outside = false;
    for (float v : samples) {
        (v < iso ? any_inside : any_outside) = true;
        if (any_inside && any_outside) {
            return true;
        }
    }
    return false;
}

struct VertexLess {
    bool operator()(const Vec3& a, const Vec3& b) const {
        if (a.x != b.x) return a.x < b.x;
        if (a.y != b.y) return a.y < b.y;
        return a.z < b.z;
    }
};

void add_box(GeometryBuffer& out, const Aabb3& box) {
    uint32_t base = static_cast<uint32_t>(out.vertices.size());
    for (int c = 0; c < 8; ++c) {
        Vec3 o = corner_offset(c);
        out.add_vertex({o.x > 0 ? box.max.x : box.min.x,
                        o.y > 0 ? box.max.y : box.min.y,
                        o.z > 0 ? box.max.z : box.min.z});
    }
    const uint32_t faces[12][3] = {
        {0, 2, 1}, {1, 2, 3}, {4, 5, 6}, {5, 7, 6},
        {0, 1, 4}, {1, 5, 4}, {2, 6, 3}, {3, 6, 7},
        {0, 4, 2}, {2, 4, 6}, {1, 3, 5}, {3, 7, 5}
    };
    for (const auto& f : faces) {
        out.add_triangle(base + f[0], base + f[1], base + f[2]);
    }
}

}  // namespace

GeometryBuffer mesh_chunk(const std::vector<float>& samples, const ChunkGrid& grid, float iso_value) {
    GeometryBuffer out;
    std::vector<uint32_t> cell_vertex(CHUNK_SAMPLES, NO_VERTEX);
    std::vector<std::array<int64_t, 3>> surface_cells;

    // One vertex per cell whose corners straddle the iso value, placed at the
    // mean of the edge crossings
    for (int64_t z = 0; z < CELL_SIDE; ++z) {
        for (int64_t y = 0; y < CELL_SIDE; ++y) {
            for (int64_t x = 0; x < CELL_SIDE; ++x) {
                float corners[8];
                int inside = 0;
                for (int c = 0; c < 8; ++c) {
                    corners[c] = samples[sample_index(x + (c & 1), y + ((c >> 1) & 1), z + ((c >> 2) & 1))];
                    inside += corners[c] < iso_value ? 1 : 0;
                }
                if (inside == 0 || inside == 8) {
                    continue;
                }

                Vec3 sum;
                int crossings = 0;
                for (const auto& edge : CUBE_EDGES) {
                    float d0 = corners[edge[0]];
                    float d1 = corners[edge[1]];
                    if ((d0 < iso_value) == (d1 < iso_value)) {
                        continue;
                    }
                    float t = (iso_value - d0) / (d1 - d0);
                    sum += lerp(corner_offset(edge[0]), corner_offset(edge[1]), t);
                    ++crossings;
                }
                Vec3 local = sum / static_cast<float>(crossings);
                Vec3 position{
                    grid.origin.x + (static_cast<float>(grid.first[0] + x) + local.x) * grid.voxel,
                    grid.origin.y + (static_cast<float>(grid.first[1] + y) + local.y) * grid.voxel,
                    grid.origin.z + (static_cast<float>(grid.first[2] + z) + local.z) * grid.voxel};
                cell_vertex[sample_index(x, y, z)] = out.add_vertex(position);
                surface_cells.push_back({x, y, z});
            }
        }
    }

    // Quads around every sign-changing lattice edge owned by this chunk.
    // The lattice edge from p along `axis` is shared by cells p, p-b, p-c and
    // p-b-c where (axis, b, c) is a cyclic permutation of (x, y, z).
    const int64_t strides[3] = {1, PADDED_CHUNK_SIDE, PADDED_CHUNK_SIDE * PADDED_CHUNK_SIDE};
    for (const auto& p : surface_cells) {
        size_t p_index = sample_index(p[0], p[1], p[2]);
        for (int axis = 0; axis < 3; ++axis) {
            int b = (axis + 1) % 3;
            int c = (axis + 2) % 3;
            if (p[b] == 0 || p[c] == 0 || p[axis] == CELL_SIDE - 1) {
                continue;
            }
            float d1 = samples[p_index];
            float d2 = samples[p_index + strides[axis]];
            bool negative_face;
            if (d1 < iso_value && d2 >= iso_value) {
                negative_face = false;
            } else if (d1 >= iso_value && d2 < iso_value) {
                negative_face = true;
            } else {
                continue;
            }
            uint32_t v1 = cell_vertex[p_index];
            uint32_t v2 = cell_vertex[p_index - strides[b]];
            uint32_t v3 = cell_vertex[p_index - strides[c]];
            uint32_t v4 = cell_vertex[p_index - strides[b] - strides[c]];
            if (negative_face) {
                out.add_triangle(v1, v4, v2);
                out.add_triangle(v1, v3, v4);
            } else {
                out.add_triangle(v1, v2, v4);
                out.add_triangle(v1, v4, v3);
            }
        }
    }
    return out;
}

SurfaceNetsResult mesh_field(const DistanceField& field, const SurfaceNetsParams& params) {
    auto log = logging::get_logger();

    if (!(params.voxel_size > 0.0f) || !std::isfinite(params.voxel_size)) {
        throw ExecutionError("surface nets: voxel size must be positive");
    }
    Aabb3 box = field.bounds();
    if (box.empty()) {
        throw ExecutionError("surface nets: field has no primitives");
    }
    const float voxel = params.voxel_size;
    box.grow(2.0f * voxel + std::abs(params.iso_value));

    // Counted in double so an oversized box is refused before any integer cast
    Vec3 size = box.size();
    std::array<double, 3> chunks_per_axis{};
    double chunk_product = 1.0;
    for (int axis = 0; axis < 3; ++axis) {
        double samples = std::ceil(static_cast<double>(size[axis]) / voxel) + 1.0;
        chunks_per_axis[axis] = std::ceil(samples / UNPADDED_CHUNK_SIDE);
        chunk_product *= chunks_per_axis[axis];
    }
    if (!std::isfinite(chunk_product) || chunk_product > static_cast<double>(params.max_chunks)) {
        throw ExecutionError(fmt::format("surface nets: {:.0f} chunks exceeds the limit of {}",
                                         chunk_product, params.max_chunks));
    }
    std::array<int64_t, 3> chunk_dims{};
    for (int axis = 0; axis < 3; ++axis) {
        chunk_dims[axis] = static_cast<int64_t>(chunks_per_axis[axis]);
    }
    const auto total = static_cast<size_t>(chunk_dims[0] * chunk_dims[1] * chunk_dims[2]);
    log->debug("surface nets: voxel {}, {}x{}x{} chunks", voxel,
               chunk_dims[0], chunk_dims[1], chunk_dims[2]);

    // Primitives farther than this from a chunk cannot affect its mixed cells
    const float margin = 2.5f * voxel + std::abs(params.iso_value);

    std::vector<GeometryBuffer> chunk_meshes(total);
    std::vector<Aabb3> chunk_boxes(total);
    std::string first_error;

    #pragma omp parallel for schedule(dynamic) if(total > 1)
    for (int64_t n = 0; n < static_cast<int64_t>(total); ++n) {
        try {
            int64_t cx = n % chunk_dims[0];
            int64_t cy = (n / chunk_dims[0]) % chunk_dims[1];
            int64_t cz = n / (chunk_dims[0] * chunk_dims[1]);

            ChunkGrid grid;
            grid.origin = box.min;
            grid.voxel = voxel;
            grid.first = {cx * UNPADDED_CHUNK_SIDE - 1, cy * UNPADDED_CHUNK_SIDE - 1,
                          cz * UNPADDED_CHUNK_SIDE - 1};

            std::vector<float> samples;
            field.sample_chunk(grid, margin, samples);
            if (!has_sign_change(samples, params.iso_value)) {
                continue;
            }
            chunk_meshes[n] = mesh_chunk(samples, grid, params.iso_value);
            chunk_boxes[n] = grid.bounds();
        } catch (const std::exception& e) {
            #pragma omp critical
            {
                if (first_error.empty()) {
                    first_error = e.what();
                }
            }
        }
    }
    if (!first_error.empty()) {
        throw ExecutionError("surface nets: " + first_error);
    }

    // Merge in chunk order, welding vertices shared along chunk borders
    SurfaceNetsResult result;
    result.chunks_total = total;
    std::map<Vec3, uint32_t, VertexLess> welded;
    std::vector<uint32_t> remap;
    for (size_t n = 0; n < total; ++n) {
        const GeometryBuffer& chunk = chunk_meshes[n];
        if (chunk.indices.empty()) {
            continue;
        }
        ++result.chunks_meshed;
        remap.assign(chunk.vertices.size(), NO_VERTEX);
        for (size_t v = 0; v < chunk.vertices.size(); ++v) {
            auto it = welded.find(chunk.vertices[v]);
            if (it == welded.end()) {
                uint32_t id = result.mesh.add_vertex(chunk.vertices[v]);
                it = welded.emplace(chunk.vertices[v], id).first;
            }
            remap[v] = it->second;
        }
        for (size_t t = 0; t + 2 < chunk.indices.size(); t += 3) {
            uint32_t a = remap[chunk.indices[t]];
            uint32_t b = remap[chunk.indices[t + 1]];
            uint32_t c = remap[chunk.indices[t + 2]];
            if (a != b && b != c && a != c) {
                result.mesh.add_triangle(a, b, c);
            }
        }
    }

    if (params.debug_chunks) {
        for (size_t n = 0; n < total; ++n) {
            if (!chunk_meshes[n].indices.empty()) {
                add_box(result.mesh, chunk_boxes[n]);
            }
        }
    }

    log->debug("surface nets: {} of {} chunks meshed, {} vertices, {} triangles",
               result.chunks_meshed, result.chunks_total,
               result.mesh.vertices.size(), result.mesh.indices.size() / 3);
    return result;
}

}  // namespace geomill::sdf
