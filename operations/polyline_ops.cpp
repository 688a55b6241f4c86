#include "polyline_ops.hpp"
#include <common/error.hpp>
#include <config/config_options.hpp>
#include <geometry/mesh_format.hpp>
#include <geometry/model.hpp>
#include <geometry/polyline.hpp>
#include <common/logging.hpp>
#include <math/aabb.hpp>
#include <voronoi/planar_frame.hpp>
#include <fmt/format.h>
#include <map>
#include <tuple>

namespace geomill {

namespace {

// Refuse discretizations that would add more vertices than this
constexpr size_t MAX_DISCRETIZE_VERTICES = 10'000'000;

}  // namespace

void SimplifyRdpOp::validate(const ConfigMap& config) const {
    options::check_positive("epsilon", options::get_float(config, "epsilon"));
    options::get_bool(config, "simplify_3d", false);
    auto format = declared_format(config);
    if (format && *format != MeshFormat::LineChunks) {
        throw ValidationError(keys::MESH_FORMAT,
                              std::string("mesh.format: expected line_chunks, got ") + to_string(*format));
    }
}

OperationResult SimplifyRdpOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    double epsilon = options::get_float(config, "epsilon");
    bool use_3d = options::get_bool(config, "simplify_3d", false);
    auto models = collect_models(config, input);
    const Model& model = models.front();
    if (model.indices.size() % 2 != 0) {
        throw ExecutionError("simplify_rdp: edge list has an odd number of indices");
    }

    OperationResult result;
    std::map<uint32_t, uint32_t> remap;
    auto vertex = [&](uint32_t id) {
        auto it = remap.find(id);
        if (it == remap.end()) {
            it = remap.emplace(id, result.geometry.add_vertex(model.vertices[id])).first;
        }
        return it->second;
    };

    for (const auto& chain : chain_edges(model.indices, model.vertices.size())) {
        std::vector<Vec3> points;
        points.reserve(chain.size());
        for (uint32_t id : chain) {
            points.push_back(model.vertices[id]);
        }
        std::vector<size_t> kept = simplify_rdp(points, epsilon, use_3d);
        for (size_t i = 0; i + 1 < kept.size(); ++i) {
            result.geometry.add_edge(vertex(chain[kept[i]]), vertex(chain[kept[i + 1]]));
        }
    }
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

void ConvexHull2dOp::validate(const ConfigMap& /*config*/) const {}

OperationResult ConvexHull2dOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto models = collect_models(config, input);
    const Model& model = models.front();
    for (const auto& v : model.vertices) {
        if (!v.is_finite()) {
            throw ExecutionError("convex_hull_2d: input contains a non-finite coordinate");
        }
    }
    std::vector<size_t> hull = convex_hull_xy(model.vertices);
    if (hull.size() < 3) {
        throw ExecutionError("convex_hull_2d: need at least three non-collinear points");
    }

    OperationResult result;
    for (size_t id : hull) {
        result.geometry.add_vertex(model.vertices[id]);
    }
    auto n = static_cast<uint32_t>(hull.size());
    for (uint32_t i = 0; i < n; ++i) {
        result.geometry.add_edge(i, (i + 1) % n);
    }
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

void OutlineOp::validate(const ConfigMap& config) const {
    auto format = declared_format(config);
    if (format && *format != MeshFormat::Triangulated) {
        throw ValidationError(keys::MESH_FORMAT,
                              std::string("mesh.format: expected triangulated, got ") + to_string(*format));
    }
}

OperationResult OutlineOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    auto models = collect_models(config, input);
    const Model& model = models.front();
    if (model.indices.empty()) {
        throw ExecutionError("2d_outline: input has no triangles");
    }
    if (model.indices.size() % 3 != 0) {
        throw ExecutionError("2d_outline: index count is not a multiple of 3");
    }
    for (size_t t = 0; t < model.indices.size(); t += 3) {
        uint32_t a = model.indices[t];
        uint32_t b = model.indices[t + 1];
        uint32_t c = model.indices[t + 2];
        if (a == b || b == c || a == c) {
            throw ExecutionError(fmt::format("2d_outline: face {} repeats a vertex", t / 3));
        }
    }
    // Only checks that the mesh is flat in one axis-aligned plane
    voronoi::PlanarFrame::fit(model.vertices, 1.0);

    OperationResult result;
    std::map<uint32_t, uint32_t> remap;
    auto vertex = [&](uint32_t id) {
        auto it = remap.find(id);
        if (it == remap.end()) {
            it = remap.emplace(id, result.geometry.add_vertex(model.vertices[id])).first;
        }
        return it->second;
    };
    std::vector<uint32_t> edges = outline_edges(model.indices);
    for (size_t e = 0; e + 1 < edges.size(); e += 2) {
        uint32_t a = vertex(edges[e]);
        result.geometry.add_edge(a, vertex(edges[e + 1]));
    }
    logging::get_logger()->debug("2d_outline: {} of {} edges are on the boundary", edges.size() / 2,
                                 model.indices.size());
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

double DiscretizeOp::parse(const ConfigMap& config) {
    double percent = options::get_float(config, "discretize_length");
    options::check_positive("discretize_length", percent);
    options::check_range("discretize_length", percent, 0.0, 100.0);
    return percent;
}

void DiscretizeOp::validate(const ConfigMap& config) const {
    parse(config);
    auto format = declared_format(config);
    if (format && *format != MeshFormat::LineChunks) {
        throw ValidationError(keys::MESH_FORMAT,
                              std::string("mesh.format: expected line_chunks, got ") + to_string(*format));
    }
}

OperationResult DiscretizeOp::execute(const ConfigMap& config, const GeometryBuffer& input) const {
    double percent = parse(config);
    auto models = collect_models(config, input);
    const Model& model = models.front();
    if (model.vertices.empty()) {
        throw ExecutionError("discretize: input vertex list is empty");
    }
    if (model.indices.size() % 2 != 0) {
        throw ExecutionError("discretize: edge list has an odd number of indices");
    }
    Aabb3 box;
    for (const auto& v : model.vertices) {
        if (!v.is_finite()) {
            throw ExecutionError(fmt::format("discretize: only finite coordinates are allowed ({}, {}, {})",
                                             v.x, v.y, v.z));
        }
        box.expand(v);
    }
    const double max_length = static_cast<double>(box.longest_side()) * percent / 100.0;
    if (!(max_length > 0.0)) {
        throw ExecutionError("discretize: input has no extent");
    }

    std::vector<Chain> chains = chain_edges(model.indices, model.vertices.size());
    size_t added = 0;
    for (const auto& chain : chains) {
        for (size_t i = 0; i + 1 < chain.size(); ++i) {
            double length = model.vertices[chain[i]].distance_to(model.vertices[chain[i + 1]]);
            added += segment_pieces(length, max_length) - 1;
        }
        if (added > MAX_DISCRETIZE_VERTICES) {
            throw ExecutionError(fmt::format("discretize: would add more than {} vertices",
                                             MAX_DISCRETIZE_VERTICES));
        }
    }

    // Input vertices are shared by position; inserted points are always new
    OperationResult result;
    std::map<std::tuple<float, float, float>, uint32_t> welded;
    auto vertex = [&](const Vec3& p) {
        auto key = std::make_tuple(p.x, p.y, p.z);
        auto it = welded.find(key);
        if (it == welded.end()) {
            it = welded.emplace(key, result.geometry.add_vertex(p)).first;
        }
        return it->second;
    };

    std::vector<bool> on_edge(model.vertices.size(), false);
    for (uint32_t id : model.indices) {
        on_edge[id] = true;
    }
    for (size_t v = 0; v < model.vertices.size(); ++v) {
        if (!on_edge[v]) {
            vertex(model.vertices[v]);
        }
    }

    for (const auto& chain : chains) {
        for (size_t i = 0; i + 1 < chain.size(); ++i) {
            const Vec3& from = model.vertices[chain[i]];
            const Vec3& to = model.vertices[chain[i + 1]];
            size_t pieces = segment_pieces(from.distance_to(to), max_length);
            uint32_t previous = vertex(from);
            for (size_t k = 1; k < pieces; ++k) {
                float t = static_cast<float>(k) / static_cast<float>(pieces);
                uint32_t next = result.geometry.add_vertex(lerp(from, to, t));
                result.geometry.add_edge(previous, next);
                previous = next;
            }
            result.geometry.add_edge(previous, vertex(to));
        }
    }
    logging::get_logger()->debug("discretize: max length {}, {} vertices added", max_length, added);
    set_format(result.config, MeshFormat::LineChunks);
    return result;
}

}  // namespace geomill
