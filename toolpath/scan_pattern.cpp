#include "scan_pattern.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <string>

namespace geomill::toolpath {

namespace {

// Refuse scans that would produce more samples than this
constexpr double MAX_SAMPLES = 50'000'000.0;

}  // namespace

std::vector<float> spaced_values(float lo, float hi, float step) {
    if (hi <= lo) {
        return {lo};
    }
    auto gaps = static_cast<size_t>(std::ceil((hi - lo) / step));
    gaps = std::max<size_t>(gaps, 1);
    std::vector<float> values(gaps + 1);
    for (size_t i = 0; i <= gaps; ++i) {
        values[i] = lo + (hi - lo) * static_cast<float>(i) / static_cast<float>(gaps);
    }
    values.back() = hi;
    return values;
}

ToolPath generate_toolpath(const DropCutter& cutter, const ScanParams& params) {
    auto log = logging::get_logger();

    double estimate = (std::ceil((params.max_x - params.min_x) / params.sample_distance) + 1.0) *
                      (std::ceil((params.max_y - params.min_y) / params.line_spacing) + 1.0);
    if (estimate > MAX_SAMPLES) {
        throw ExecutionError("toolpath: scan would need more than 50000000 samples");
    }

    std::vector<float> xs = spaced_values(params.min_x, params.max_x, params.sample_distance);
    std::vector<float> ys = spaced_values(params.min_y, params.max_y, params.line_spacing);
    std::vector<std::vector<Vec3>> lines(ys.size());

    std::string first_error;

    #pragma omp parallel for schedule(dynamic) if(ys.size() > 4)
    for (int64_t l = 0; l < static_cast<int64_t>(ys.size()); ++l) {
        try {
            std::vector<Vec3>& line = lines[l];
            line.reserve(xs.size());
            float y = ys[l];
            for (float x : xs) {
                float z = cutter.height_at(x, y).value_or(params.minimum_z);
                z = std::max(z, params.minimum_z);
                if (!std::isfinite(z)) {
                    throw ExecutionError(fmt::format("non-finite height at ({}, {})", x, y));
                }
                line.emplace_back(x, y, z);
            }
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
        throw ExecutionError("toolpath: " + first_error);
    }

    ToolPath path;
    path.line_count = lines.size();
    for (size_t l = 0; l < lines.size(); ++l) {
        std::vector<Vec3>& line = lines[l];
        if (params.strategy == Strategy::Meander) {
            if (l % 2 == 1) {
                std::reverse(line.begin(), line.end());
            }
        } else if (!path.points.empty()) {
            Vec3 last = path.points.back();
            path.points.emplace_back(last.x, last.y, params.safe_z);
            path.points.emplace_back(line.front().x, line.front().y, params.safe_z);
        }
        path.points.insert(path.points.end(), line.begin(), line.end());
    }

    log->debug("toolpath: {} lines x {} samples, {} points", ys.size(), xs.size(), path.points.size());
    return path;
}

}  // namespace geomill::toolpath
