#include "lsystem_op.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <config/config_options.hpp>
#include <geometry/mesh_format.hpp>
#include <sdf/surface_nets.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <map>
#include <tuple>

namespace geomill {

namespace {

// Turtle positions closer than step * WELD_FRACTION share a vertex
constexpr double WELD_FRACTION = 1e-4;

// Largest magnitude that llround maps into int64_t
constexpr double MAX_WELD_KEY = 9.0e18;

int64_t weld_key(float coordinate, double quantum) {
    double scaled = static_cast<double>(coordinate) / quantum;
    if (!std::isfinite(scaled) || std::abs(scaled) > MAX_WELD_KEY) {
        throw ExecutionError(fmt::format("lsystem: turtle position {} is out of range for step quantum {}",
                                         coordinate, quantum));
    }
    return std::llround(scaled);
}

GeometryBuffer strokes_to_lines(const std::vector<lsystem::Stroke>& strokes, float step) {
    GeometryBuffer out;
    std::map<std::tuple<int64_t, int64_t, int64_t>, uint32_t> welded;
    const double quantum = static_cast<double>(step) * WELD_FRACTION;
    auto vertex = [&](const Vec3& p) {
        auto key = std::make_tuple(weld_key(p.x, quantum), weld_key(p.y, quantum),
                                   weld_key(p.z, quantum));
        auto it = welded.find(key);
        if (it != welded.end()) {
            return it->second;
        }
        uint32_t id = out.add_vertex(p);
        welded.emplace(key, id);
        return id;
    };
    for (const auto& stroke : strokes) {
        uint32_t a = vertex(stroke.from);
        uint32_t b = vertex(stroke.to);
        if (a != b) {
            out.add_edge(a, b);
        }
    }
    return out;
}

}  // namespace

LSystemParams LSystemOp::parse(const ConfigMap& config) {
    LSystemParams params;
    params.grammar = lsystem::parse_grammar(options::require(config, "grammar"),
                                            config.get("rules").value_or(""));

    int64_t iterations = options::get_int(config, "iterations");
    options::check_range("iterations", static_cast<double>(iterations), 0.0, 16.0);
    params.iterations = static_cast<int>(iterations);

    int64_t max_symbols = options::get_int(config, "max_symbols", 5000000);
    options::check_range("max_symbols", static_cast<double>(max_symbols), 1.0, 50000000.0);
    params.max_symbols = static_cast<size_t>(max_symbols);

    double step = options::get_float(config, "step", 1.0);
    params.turtle.step = options::to_float("step", step);
    options::check_positive("step", params.turtle.step);
    params.turtle.angle = options::to_float("angle", options::get_float(config, "angle", 90.0));

    if (config.has("random_seed")) {
        int64_t seed = options::get_int(config, "random_seed");
        options::check_range("random_seed", static_cast<double>(seed), 0.0,
                             static_cast<double>(std::numeric_limits<uint32_t>::max()));
        params.turtle.seed = static_cast<uint32_t>(seed);
    }
    double jitter = options::get_float(config, "angle_jitter", 0.0);
    options::check_range("angle_jitter", jitter, 0.0, 180.0);
    params.turtle.angle_jitter = options::to_float("angle_jitter", jitter);

    if (config.has("sdf_divisions")) {
        int64_t divisions = options::get_int(config, "sdf_divisions");
        options::check_range("sdf_divisions", static_cast<double>(divisions), 10.0, 600.0);
        params.sdf_divisions = static_cast<int>(divisions);
    }
    double radius = options::get_float(config, "sdf_radius", 0.1 * step);
    params.sdf_radius = options::to_float("sdf_radius", radius);
    options::check_positive("sdf_radius", params.sdf_radius);
    return params;
}

void LSystemOp::validate(const ConfigMap& config) const {
    parse(config);
}

OperationResult LSystemOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();
    LSystemParams params = parse(config);

    std::string symbols = lsystem::expand(params.grammar, params.iterations, params.max_symbols);
    lsystem::Turtle turtle(params.turtle);
    std::vector<lsystem::Stroke> strokes = turtle.run(symbols);
    log->debug("lsystem: {} symbols, {} strokes", symbols.size(), strokes.size());

    OperationResult result;
    result.config.set("lsystem.strokes", std::to_string(strokes.size()));

    if (!input.vertices.empty()) {
        result.geometry.vertices = input.vertices;
        result.geometry.indices = input.indices;
        for (const auto& stroke : strokes) {
            result.geometry.add_matrix(stroke.frame);
        }
        set_format(result.config, declared_format(config).value_or(MeshFormat::Triangulated));
        return result;
    }

    if (!params.sdf_divisions) {
        result.geometry = strokes_to_lines(strokes, params.turtle.step);
        set_format(result.config, MeshFormat::LineChunks);
        return result;
    }

    if (strokes.empty()) {
        throw ExecutionError("lsystem: nothing was drawn, cannot build a mesh");
    }
    sdf::CapsuleField field;
    for (const auto& stroke : strokes) {
        field.add_capsule(stroke.from, stroke.to, params.sdf_radius);
    }
    sdf::SurfaceNetsParams mesher;
    mesher.voxel_size = field.bounds().longest_side() / static_cast<float>(*params.sdf_divisions);
    auto meshed = sdf::mesh_field(field, mesher);
    result.geometry = std::move(meshed.mesh);
    result.config.set("sdf.chunks", std::to_string(meshed.chunks_meshed));
    set_format(result.config, MeshFormat::Triangulated);
    return result;
}

}  // namespace geomill
