#ifndef GEOMILL_TOOLPATH_SCAN_PATTERN_HPP
#define GEOMILL_TOOLPATH_SCAN_PATTERN_HPP

#include <toolpath/drop_cutter.hpp>
#include <math/vec3.hpp>
#include <vector>

namespace geomill::toolpath {

enum class Strategy {
    Meander,  // alternate direction, lines linked directly
    Raster    // every line in +X, linked through retract moves
};

struct ScanParams {
    Strategy strategy = Strategy::Meander;
    float line_spacing = 1.0f;     // distance between scan lines (Y)
    float sample_distance = 1.0f;  // distance between samples along a line (X)
    float minimum_z = 0.0f;
    float safe_z = 0.0f;
    // XY area to cover
    float min_x = 0.0f;
    float max_x = 0.0f;
    float min_y = 0.0f;
    float max_y = 0.0f;
};

struct ToolPath {
    std::vector<Vec3> points;  // tool-tip positions in cutting order
    size_t line_count = 0;
};

// Evenly spaced coordinates covering [lo, hi] with both ends included and
// gaps no larger than `step`
std::vector<float> spaced_values(float lo, float hi, float step);

// Drop-cutter samples along scan lines parallel to X. Lines are computed in
// parallel and joined in order.
ToolPath generate_toolpath(const DropCutter& cutter, const ScanParams& params);

}  // namespace geomill::toolpath

#endif // GEOMILL_TOOLPATH_SCAN_PATTERN_HPP
