#ifndef GEOMILL_SDF_DISTANCE_FIELD_HPP
#define GEOMILL_SDF_DISTANCE_FIELD_HPP

#include <math/aabb.hpp>
#include <math/vec3.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace geomill::sdf {

// Cells owned by one chunk along each axis
constexpr int64_t UNPADDED_CHUNK_SIDE = 14;
// Samples per chunk along each axis (one sample of padding on each side)
constexpr int64_t PADDED_CHUNK_SIDE = 16;
constexpr size_t CHUNK_SAMPLES = PADDED_CHUNK_SIDE * PADDED_CHUNK_SIDE * PADDED_CHUNK_SIDE;
// Value reported where no primitive is within reach
constexpr float DEFAULT_SDF_VALUE = 999.0f;

// Sample lattice of one chunk. Sample (i, j, k) of the chunk sits at
// origin + (first + (i, j, k)) * voxel, so chunks sharing a sample compute
// bit-identical positions.
struct ChunkGrid {
    Vec3 origin;
    float voxel = 1.0f;
    std::array<int64_t, 3> first{};

    Vec3 sample_position(int64_t i, int64_t j, int64_t k) const {
        return {origin.x + static_cast<float>(first[0] + i) * voxel,
                origin.y + static_cast<float>(first[1] + j) * voxel,
                origin.z + static_cast<float>(first[2] + k) * voxel};
    }

    Aabb3 bounds() const {
        Aabb3 box;
        box.expand(sample_position(0, 0, 0));
        box.expand(sample_position(PADDED_CHUNK_SIDE - 1, PADDED_CHUNK_SIDE - 1, PADDED_CHUNK_SIDE - 1));
        return box;
    }
};

inline size_t sample_index(int64_t i, int64_t j, int64_t k) {
    return static_cast<size_t>(i + PADDED_CHUNK_SIDE * (j + PADDED_CHUNK_SIDE * k));
}

// Signed distance source, negative inside
class DistanceField {
public:
    virtual ~DistanceField() = default;

    // Box enclosing the zero level set
    virtual Aabb3 bounds() const = 0;

    // Fills `out` with CHUNK_SAMPLES values (x fastest). Only primitives
    // within `margin` of the chunk need to be considered; samples farther
    // than that from every primitive may report DEFAULT_SDF_VALUE with the
    // correct sign.
    virtual void sample_chunk(const ChunkGrid& grid, float margin, std::vector<float>& out) const = 0;
};

// Union of capsules (a sphere is a capsule with equal ends)
class CapsuleField : public DistanceField {
public:
    void add_capsule(const Vec3& a, const Vec3& b, float radius);
    void add_sphere(const Vec3& center, float radius) { add_capsule(center, center, radius); }

    size_t size() const { return capsules_.size(); }

    Aabb3 bounds() const override { return bounds_; }
    void sample_chunk(const ChunkGrid& grid, float margin, std::vector<float>& out) const override;

    float distance(const Vec3& p) const;

private:
    struct Capsule {
        Vec3 a;
        Vec3 b;
        float radius;
        Aabb3 box;
    };

    static float capsule_distance(const Capsule& c, const Vec3& p);

    std::vector<Capsule> capsules_;
    Aabb3 bounds_;
};

// Closed triangle mesh. Magnitude is the distance to the nearest triangle,
// the sign comes from the parity of +Z ray crossings.
class MeshField : public DistanceField {
public:
    MeshField(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& triangles);

    size_t size() const { return triangles_.size(); }

    Aabb3 bounds() const override { return bounds_; }
    void sample_chunk(const ChunkGrid& grid, float margin, std::vector<float>& out) const override;

    float distance(const Vec3& p) const;

private:
    struct Triangle {
        Vec3 a;
        Vec3 b;
        Vec3 c;
        Aabb3 box;
    };

    // Heights where the vertical line through (x, y) crosses the mesh, sorted
    std::vector<float> column_crossings(float x, float y) const;
    static int inside_count(const std::vector<float>& crossings, float z);

    std::vector<Triangle> triangles_;
    Aabb3 bounds_;

    // XY bins of triangle ids for the crossing queries
    size_t bins_x_ = 1;
    size_t bins_y_ = 1;
    float bin_w_ = 1.0f;
    float bin_h_ = 1.0f;
    std::vector<std::vector<uint32_t>> bins_;
};

float point_triangle_distance(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c);
float point_segment_distance(const Vec3& p, const Vec3& a, const Vec3& b);

}  // namespace geomill::sdf

#endif // GEOMILL_SDF_DISTANCE_FIELD_HPP
