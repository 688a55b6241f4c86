#include "cli_common.hpp"
#include <common/logging.hpp>
#include <config/config_map.hpp>
#include <ffi/geomill_api.h>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>

namespace geomill::cli {

namespace {

// Calls the C entry point the way a host would and copies the result out
Document call_library(const Document& request) {
    std::vector<std::string> keys;
    std::vector<std::string> values;
    for (const auto& [key, value] : request.config) {
        keys.push_back(key);
        values.push_back(value);
    }
    std::vector<char*> key_ptrs;
    std::vector<char*> value_ptrs;
    for (size_t i = 0; i < keys.size(); ++i) {
        key_ptrs.push_back(keys[i].data());
        value_ptrs.push_back(values[i].data());
    }
    StringMap config{key_ptrs.data(), value_ptrs.data(), keys.size()};

    std::vector<GeomillVector3> vertices;
    vertices.reserve(request.geometry.vertices.size());
    for (const auto& v : request.geometry.vertices) {
        vertices.push_back({v.x, v.y, v.z});
    }

    ProcessResult result = process_geometry(
        vertices.data(), vertices.size(),
        request.geometry.indices.data(), request.geometry.indices.size(),
        request.geometry.matrices.data(), request.geometry.matrices.size(),
        &config);

    Document response;
    for (size_t i = 0; i < result.geometry.vertex_count; ++i) {
        const GeomillVector3& v = result.geometry.vertices[i];
        response.geometry.vertices.emplace_back(v.x, v.y, v.z);
    }
    response.geometry.indices.assign(result.geometry.indices,
                                     result.geometry.indices + result.geometry.index_count);
    response.geometry.matrices.assign(result.geometry.matrices,
                                      result.geometry.matrices + result.geometry.matrix_count);
    for (size_t i = 0; i < result.map.count; ++i) {
        response.config.set(result.map.keys[i], result.map.values[i]);
    }
    free_process_result(&result);
    return response;
}

}  // namespace

int command_run(int argc, char** argv) {
    auto log = geomill::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: geomill_cli run <request.json> -o <response.json> [-s key=value ...]\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Running request: {}", ctx.input_path);
        Document request = Document::from_json(json::read_json_file(ctx.input_path));
        for (const auto& [key, value] : ctx.overrides) {
            request.config.set(key, value);
        }

        Document response = call_library(request);
        json::write_json_file(ctx.output_path, response.to_json());

        if (auto error = response.config.get(keys::ERROR_KEY)) {
            log->error("Command failed: {}", *error);
            std::cerr << "Error: " << *error << "\n";
            return 1;
        }

        std::cerr << "Wrote " << ctx.output_path << " ("
                  << response.geometry.vertices.size() << " vertices, "
                  << response.geometry.indices.size() << " indices, "
                  << response.geometry.matrix_count() << " matrices)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace geomill::cli
