#include "turtle.hpp"
#include <common/error.hpp>
#include <cmath>
#include <numbers>

namespace geomill::lsystem {

Vec3 rotate(const Vec3& v, const Vec3& axis, float degrees) {
    float radians = degrees * std::numbers::pi_v<float> / 180.0f;
    float c = std::cos(radians);
    float s = std::sin(radians);
    return v * c + axis.cross(v) * s + axis * (axis.dot(v) * (1.0f - c));
}

Turtle::Turtle(const TurtleParams& params) : params_(params) {
    if (params_.seed) {
        rng_.seed(*params_.seed);
    }
}

float Turtle::next_angle(float base) {
    if (!params_.seed || params_.angle_jitter <= 0.0f) {
        return base;
    }
    std::uniform_real_distribution<float> jitter(-params_.angle_jitter, params_.angle_jitter);
    return base + jitter(rng_);
}

void Turtle::yaw(float degrees) {
    state_.heading = rotate(state_.heading, state_.up, degrees).normalized();
}

void Turtle::pitch(float degrees) {
    Vec3 axis = state_.right().normalized();
    state_.heading = rotate(state_.heading, axis, degrees).normalized();
    state_.up = rotate(state_.up, axis, degrees).normalized();
}

void Turtle::roll(float degrees) {
    state_.up = rotate(state_.up, state_.heading, degrees).normalized();
}

std::vector<Stroke> Turtle::run(const std::string& symbols) {
    std::vector<Stroke> strokes;
    for (char symbol : symbols) {
        switch (symbol) {
            case 'F':
            case 'G': {
                Stroke stroke;
                stroke.frame = state_.frame();
                stroke.from = state_.position;
                state_.position += state_.heading * params_.step;
                stroke.to = state_.position;
                strokes.push_back(stroke);
                break;
            }
            case 'f':
                state_.position += state_.heading * params_.step;
                break;
            case '+': yaw(next_angle(params_.angle)); break;
            case '-': yaw(-next_angle(params_.angle)); break;
            case '&': pitch(-next_angle(params_.angle)); break;
            case '^': pitch(next_angle(params_.angle)); break;
            case '\\': roll(next_angle(params_.angle)); break;
            case '/': roll(-next_angle(params_.angle)); break;
            case '|': yaw(180.0f); break;
            case '[':
                stack_.push_back(state_);
                break;
            case ']':
                if (stack_.empty()) {
                    throw ExecutionError("lsystem: ']' without matching '['");
                }
                state_ = stack_.back();
                stack_.pop_back();
                break;
            default:
                break;
        }
    }
    return strokes;
}

}  // namespace geomill::lsystem
