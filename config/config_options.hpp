#ifndef GEOMILL_CONFIG_CONFIG_OPTIONS_HPP
#define GEOMILL_CONFIG_CONFIG_OPTIONS_HPP

#include <config/config_map.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace geomill::options {

// Typed readers over a ConfigMap. Every failure throws ValidationError with
// the offending key, so a bad value is reported instead of crashing.

std::string require(const ConfigMap& config, const std::string& key);

double parse_float(const std::string& key, const std::string& text);
int64_t parse_int(const std::string& key, const std::string& text);
bool parse_bool(const std::string& key, const std::string& text);

double get_float(const ConfigMap& config, const std::string& key);
double get_float(const ConfigMap& config, const std::string& key, double fallback);

int64_t get_int(const ConfigMap& config, const std::string& key);
int64_t get_int(const ConfigMap& config, const std::string& key, int64_t fallback);

bool get_bool(const ConfigMap& config, const std::string& key, bool fallback);

// Case-insensitive match against `choices`; returns the canonical choice
std::string get_enum(const ConfigMap& config, const std::string& key,
                     const std::vector<std::string>& choices);
std::string get_enum(const ConfigMap& config, const std::string& key,
                     const std::vector<std::string>& choices,
                     const std::string& fallback);

// Narrows a validated double to float; throws when the result is not finite
float to_float(const std::string& key, double value);

// Range checks; the bounds are inclusive
void check_range(const std::string& key, double value, double lo, double hi);
void check_positive(const std::string& key, double value);

}  // namespace geomill::options

#endif // GEOMILL_CONFIG_CONFIG_OPTIONS_HPP
