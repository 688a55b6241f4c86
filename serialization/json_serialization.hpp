#ifndef GEOMILL_SERIALIZATION_JSON_SERIALIZATION_HPP
#define GEOMILL_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace geomill::json {

// Version of the request/response document format
constexpr const char* FORMAT_VERSION = "1";

// Current time in ISO 8601 (UTC)
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Pretty-printed with a trailing newline
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Write failed: " + path);
    }
}

// Parse errors are reported with the path and the parser's byte offset
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(path + ": invalid JSON at byte " + std::to_string(e.byte) + ": " + e.what());
    }
}

}  // namespace geomill::json

#endif // GEOMILL_SERIALIZATION_JSON_SERIALIZATION_HPP
