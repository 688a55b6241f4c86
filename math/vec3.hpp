#ifndef GEOMILL_MATH_VEC3_HPP
#define GEOMILL_MATH_VEC3_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace geomill {

// Single precision, matching the host's vertex layout
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    constexpr Vec3 operator/(float s) const { return {x / s, y / s, z / s}; }
    constexpr Vec3 operator-() const { return {-x, -y, -z}; }

    constexpr Vec3& operator+=(const Vec3& o) {
        x += o.x; y += o.y; z += o.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& o) {
        x -= o.x; y -= o.y; z -= o.z;
        return *this;
    }

    constexpr Vec3& operator*=(float s) {
        x *= s; y *= s; z *= s;
        return *this;
    }

    constexpr float dot(const Vec3& o) const {
        return x * o.x + y * o.y + z * o.z;
    }

    constexpr Vec3 cross(const Vec3& o) const {
        return {
            y * o.z - z * o.y,
            z * o.x - x * o.z,
            x * o.y - y * o.x
        };
    }

    constexpr float length_squared() const { return dot(*this); }

    float length() const { return std::sqrt(length_squared()); }

    // Zero vector stays zero
    Vec3 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return {0.0f, 0.0f, 0.0f};
    }

    float distance_to(const Vec3& o) const { return (*this - o).length(); }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    // Exact comparison; used for welding bit-identical vertices
    constexpr bool operator==(const Vec3& o) const {
        return x == o.x && y == o.y && z == o.z;
    }

    constexpr bool operator!=(const Vec3& o) const { return !(*this == o); }

    constexpr float& operator[](size_t i) {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }

    constexpr float operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

constexpr Vec3 operator*(float s, const Vec3& v) { return v * s; }

constexpr Vec3 lerp(const Vec3& a, const Vec3& b, float t) {
    return a * (1.0f - t) + b * t;
}

constexpr Vec3 component_min(const Vec3& a, const Vec3& b) {
    return {std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)};
}

constexpr Vec3 component_max(const Vec3& a, const Vec3& b) {
    return {std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_x() { return {1.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_y() { return {0.0f, 1.0f, 0.0f}; }
    constexpr Vec3 unit_z() { return {0.0f, 0.0f, 1.0f}; }
}

// Planar helper for the 2D algorithms (centerline, hull, scan lines)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    constexpr Vec2 operator*(double s) const { return {x * s, y * s}; }
    constexpr double dot(const Vec2& o) const { return x * o.x + y * o.y; }
    // z component of the 3D cross product
    constexpr double cross(const Vec2& o) const { return x * o.y - y * o.x; }
    double length() const { return std::sqrt(dot(*this)); }
    constexpr bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
};

}  // namespace geomill

#endif // GEOMILL_MATH_VEC3_HPP
