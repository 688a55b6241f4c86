#ifndef GEOMILL_MATH_MAT4_HPP
#define GEOMILL_MATH_MAT4_HPP

#include <math/vec3.hpp>
#include <array>

namespace geomill {

// 4x4 affine transform, column-major like the host's matrix buffers:
// m[0..3] is the first column and m[12..14] the translation.
struct Mat4 {
    std::array<float, 16> m{};

    static constexpr Mat4 identity() {
        Mat4 r;
        r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.0f;
        return r;
    }

    // Build from basis columns and an origin
    static constexpr Mat4 from_frame(const Vec3& x_axis, const Vec3& y_axis,
                                     const Vec3& z_axis, const Vec3& origin) {
        Mat4 r;
        r.m = {x_axis.x, x_axis.y, x_axis.z, 0.0f,
               y_axis.x, y_axis.y, y_axis.z, 0.0f,
               z_axis.x, z_axis.y, z_axis.z, 0.0f,
               origin.x, origin.y, origin.z, 1.0f};
        return r;
    }

    static Mat4 from_values(const float* values) {
        Mat4 r;
        for (size_t i = 0; i < 16; ++i) {
            r.m[i] = values[i];
        }
        return r;
    }

    constexpr float at(size_t row, size_t col) const { return m[col * 4 + row]; }

    constexpr Vec3 transform_point(const Vec3& p) const {
        return {
            m[0] * p.x + m[4] * p.y + m[8] * p.z + m[12],
            m[1] * p.x + m[5] * p.y + m[9] * p.z + m[13],
            m[2] * p.x + m[6] * p.y + m[10] * p.z + m[14]
        };
    }

    constexpr bool operator==(const Mat4& o) const { return m == o.m; }
};

}  // namespace geomill

#endif // GEOMILL_MATH_MAT4_HPP
