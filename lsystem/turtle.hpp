#ifndef GEOMILL_LSYSTEM_TURTLE_HPP
#define GEOMILL_LSYSTEM_TURTLE_HPP

#include <math/mat4.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace geomill::lsystem {

struct TurtleState {
    Vec3 position = vec3::zero();
    Vec3 heading = vec3::unit_y();
    Vec3 up = vec3::unit_z();

    Vec3 right() const { return heading.cross(up); }

    // Columns: right, heading, up, position. Identity in the start pose.
    Mat4 frame() const { return Mat4::from_frame(right(), heading, up, position); }
};

struct TurtleParams {
    float step = 1.0f;
    float angle = 90.0f;  // degrees
    // Random angle jitter is only applied when a seed is given
    std::optional<uint32_t> seed;
    float angle_jitter = 0.0f;  // degrees
};

// One drawing move
struct Stroke {
    Mat4 frame;  // pose at the start of the move
    Vec3 from;
    Vec3 to;
};

// Interprets a symbol string:
//   F G  move forward drawing      f  move forward without drawing
//   + -  yaw left/right            & ^  pitch down/up
//   \ /  roll left/right           |    turn around
//   [ ]  push/pop the pose
// Any other symbol is ignored. Popping an empty stack throws ExecutionError.
class Turtle {
public:
    explicit Turtle(const TurtleParams& params);

    std::vector<Stroke> run(const std::string& symbols);

    const TurtleState& state() const { return state_; }

private:
    float next_angle(float base);
    void yaw(float degrees);
    void pitch(float degrees);
    void roll(float degrees);

    TurtleParams params_;
    TurtleState state_;
    std::vector<TurtleState> stack_;
    std::mt19937 rng_;
};

// Rodrigues rotation of `v` around unit `axis`
Vec3 rotate(const Vec3& v, const Vec3& axis, float degrees);

}  // namespace geomill::lsystem

#endif // GEOMILL_LSYSTEM_TURTLE_HPP
