#include "data_logger.hpp"
#include <common/logging.hpp>
#include <geometry/mesh_format.hpp>
#include <geometry/model.hpp>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/obj_writer.hpp>
#include <common/file_io.hpp>
#include <fmt/format.h>
#include <cstdlib>

namespace geomill {

namespace {

std::atomic<uint64_t> call_counter{0};

}  // namespace

DataLogger::DataLogger(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::optional<DataLogger> DataLogger::from_environment() {
    const char* path = std::getenv(DATA_LOGGER_ENV);
    if (!path || *path == '\0') {
        return std::nullopt;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        logging::get_logger()->warn("{}={} is not a directory, data logging disabled", DATA_LOGGER_ENV, path);
        return std::nullopt;
    }
    return DataLogger(path);
}

std::string DataLogger::record(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();
    std::string stamp = fmt::format("{}_{:06}", json::get_timestamp(), call_counter.fetch_add(1));
    for (char& c : stamp) {
        if (c == ':') c = '-';
    }

    try {
        nlohmann::json j;
        j["version"] = json::FORMAT_VERSION;
        j["config"] = config;
        j["vertex_count"] = input.vertices.size();
        j["index_count"] = input.indices.size();
        j["matrix_count"] = input.matrix_count();
        json::write_json_file((directory_ / (stamp + ".json")).string(), j);

        MeshFormat format = MeshFormat::Triangulated;
        try {
            format = declared_format(config).value_or(MeshFormat::Triangulated);
        } catch (const std::exception& e) {
            log->debug("data logger: {}, writing faces", e.what());
        }
        auto models = collect_models(config, input);
        for (const auto& model : models) {
            std::string name = fmt::format("{}.{}", stamp, model.index);
            write_file((directory_ / (name + ".obj")).string(),
                       to_obj(model.vertices, model.indices, format, name));
        }
        log->debug("data logger: wrote {} ({} models)", stamp, models.size());
        return stamp;
    } catch (const std::exception& e) {
        log->warn("data logger: could not record call {}: {}", stamp, e.what());
        return {};
    }
}

}  // namespace geomill
