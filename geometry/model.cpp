#include "model.hpp"
#include <common/error.hpp>
#include <config/config_options.hpp>
#include <fmt/format.h>

namespace geomill {

std::vector<Vec3> Model::world_vertices() const {
    std::vector<Vec3> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(world.transform_point(v));
    }
    return result;
}

std::string first_vertex_key(size_t n) {
    return "first_vertex_model_" + std::to_string(n);
}

std::string first_index_key(size_t n) {
    return "first_index_model_" + std::to_string(n);
}

std::vector<Model> collect_models(const ConfigMap& config, const GeometryBuffer& input) {
    // Start offsets for every model, model 0 implicit at zero
    std::vector<std::pair<size_t, size_t>> starts{{0, 0}};
    for (size_t n = 1; config.has(first_vertex_key(n)); ++n) {
        int64_t vertex_start = options::get_int(config, first_vertex_key(n));
        int64_t index_start = options::get_int(config, first_index_key(n));
        const auto& prev = starts.back();
        if (vertex_start < static_cast<int64_t>(prev.first) ||
            vertex_start > static_cast<int64_t>(input.vertices.size()) ||
            index_start < static_cast<int64_t>(prev.second) ||
            index_start > static_cast<int64_t>(input.indices.size())) {
            throw ExecutionError(fmt::format(
                "model {} range (vertex {}, index {}) is outside the input", n,
                vertex_start, index_start));
        }
        starts.emplace_back(static_cast<size_t>(vertex_start), static_cast<size_t>(index_start));
    }

    std::vector<Model> models;
    models.reserve(starts.size());
    for (size_t n = 0; n < starts.size(); ++n) {
        size_t v_begin = starts[n].first;
        size_t i_begin = starts[n].second;
        size_t v_end = n + 1 < starts.size() ? starts[n + 1].first : input.vertices.size();
        size_t i_end = n + 1 < starts.size() ? starts[n + 1].second : input.indices.size();

        Model model;
        model.index = n;
        model.vertices.assign(input.vertices.begin() + v_begin, input.vertices.begin() + v_end);
        model.indices.assign(input.indices.begin() + i_begin, input.indices.begin() + i_end);
        for (uint32_t idx : model.indices) {
            if (idx >= model.vertices.size()) {
                throw ExecutionError(fmt::format(
                    "model {} index {} is outside its {} vertices", n, idx, model.vertices.size()));
            }
        }
        if (n < input.matrix_count()) {
            model.world = input.matrix(n);
        }
        models.push_back(std::move(model));
    }
    return models;
}

}  // namespace geomill
