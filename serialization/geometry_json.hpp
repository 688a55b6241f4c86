#ifndef GEOMILL_SERIALIZATION_GEOMETRY_JSON_HPP
#define GEOMILL_SERIALIZATION_GEOMETRY_JSON_HPP

#include <nlohmann/json.hpp>
#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>
#include <math/vec3.hpp>

namespace geomill {

inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("vertex must be an array of 3 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
}

// Config values are strings on the wire; numbers and booleans in a JSON
// document are converted to their text form
inline void to_json(nlohmann::json& j, const ConfigMap& config) {
    j = nlohmann::json::object();
    for (const auto& [key, value] : config) {
        j[key] = value;
    }
}

inline void from_json(const nlohmann::json& j, ConfigMap& config) {
    config = ConfigMap();
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string()) {
            config.set(it.key(), value.get<std::string>());
        } else if (value.is_boolean()) {
            config.set(it.key(), value.get<bool>() ? "true" : "false");
        } else if (value.is_number()) {
            config.set(it.key(), value.dump());
        } else {
            throw std::runtime_error("config value for '" + it.key() + "' must be a string, number or boolean");
        }
    }
}

inline void to_json(nlohmann::json& j, const GeometryBuffer& geometry) {
    j = {
        {"vertices", geometry.vertices},
        {"indices", geometry.indices},
        {"matrices", geometry.matrices}
    };
}

inline void from_json(const nlohmann::json& j, GeometryBuffer& geometry) {
    geometry = GeometryBuffer();
    if (j.contains("vertices")) geometry.vertices = j["vertices"].get<std::vector<Vec3>>();
    if (j.contains("indices")) geometry.indices = j["indices"].get<std::vector<uint32_t>>();
    if (j.contains("matrices")) geometry.matrices = j["matrices"].get<std::vector<float>>();
}

// One call: config plus geometry. Responses use the same shape.
struct Document {
    ConfigMap config;
    GeometryBuffer geometry;

    nlohmann::json to_json() const {
        nlohmann::json j = geometry;
        j["config"] = config;
        return j;
    }

    static Document from_json(const nlohmann::json& j) {
        Document doc;
        doc.geometry = j.get<GeometryBuffer>();
        if (j.contains("config")) {
            doc.config = j["config"].get<ConfigMap>();
        }
        return doc;
    }
};

}  // namespace geomill

#endif // GEOMILL_SERIALIZATION_GEOMETRY_JSON_HPP
