#include "config_options.hpp"
#include <common/error.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace geomill::options {

namespace {

std::string trim(const std::string& text) {
    size_t first = 0;
    size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    return text.substr(first, last - first);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

std::string require(const ConfigMap& config, const std::string& key) {
    auto value = config.get(key);
    if (!value) {
        throw ValidationError(key, "missing required parameter: " + key);
    }
    return *value;
}

double parse_float(const std::string& key, const std::string& text) {
    std::string value = trim(text);
    const char* begin = value.c_str();
    char* end = nullptr;
    double result = std::strtod(begin, &end);
    if (value.empty() || end != begin + value.size()) {
        throw ValidationError(key, fmt::format("{}: expected a number, got '{}'", key, text));
    }
    if (!std::isfinite(result)) {
        throw ValidationError(key, fmt::format("{}: value must be finite, got '{}'", key, text));
    }
    return result;
}

int64_t parse_int(const std::string& key, const std::string& text) {
    std::string value = trim(text);
    int64_t result = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    if (!value.empty() && value[0] == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (value.empty() || ec != std::errc() || ptr != end) {
        throw ValidationError(key, fmt::format("{}: expected an integer, got '{}'", key, text));
    }
    return result;
}

bool parse_bool(const std::string& key, const std::string& text) {
    std::string value = to_lower(trim(text));
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ValidationError(key, fmt::format("{}: expected a boolean, got '{}'", key, text));
}

double get_float(const ConfigMap& config, const std::string& key) {
    return parse_float(key, require(config, key));
}

double get_float(const ConfigMap& config, const std::string& key, double fallback) {
    auto value = config.get(key);
    return value ? parse_float(key, *value) : fallback;
}

int64_t get_int(const ConfigMap& config, const std::string& key) {
    return parse_int(key, require(config, key));
}

int64_t get_int(const ConfigMap& config, const std::string& key, int64_t fallback) {
    auto value = config.get(key);
    return value ? parse_int(key, *value) : fallback;
}

bool get_bool(const ConfigMap& config, const std::string& key, bool fallback) {
    auto value = config.get(key);
    return value ? parse_bool(key, *value) : fallback;
}

std::string get_enum(const ConfigMap& config, const std::string& key,
                     const std::vector<std::string>& choices) {
    std::string value = to_lower(trim(require(config, key)));
    for (const auto& choice : choices) {
        if (to_lower(choice) == value) {
            return choice;
        }
    }
    throw ValidationError(key, fmt::format("{}: unsupported value '{}' (expected one of: {})",
                                           key, value, fmt::join(choices, ", ")));
}

std::string get_enum(const ConfigMap& config, const std::string& key,
                     const std::vector<std::string>& choices,
                     const std::string& fallback) {
    if (!config.has(key)) {
        return fallback;
    }
    return get_enum(config, key, choices);
}

float to_float(const std::string& key, double value) {
    float narrowed = static_cast<float>(value);
    if (!std::isfinite(narrowed)) {
        throw ValidationError(key, fmt::format("{}: value out of float range, got {}", key, value));
    }
    return narrowed;
}

void check_range(const std::string& key, double value, double lo, double hi) {
    if (value < lo || value > hi) {
        throw ValidationError(key, fmt::format("{} must be in [{}, {}], got {}", key, lo, hi, value));
    }
}

void check_positive(const std::string& key, double value) {
    if (!(value > 0.0)) {
        throw ValidationError(key, fmt::format("{} must be positive", key));
    }
}

}  // namespace geomill::options
