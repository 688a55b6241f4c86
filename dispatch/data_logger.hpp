#ifndef GEOMILL_DISPATCH_DATA_LOGGER_HPP
#define GEOMILL_DISPATCH_DATA_LOGGER_HPP

#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace geomill {

// Environment variable naming the dump directory
constexpr const char* DATA_LOGGER_ENV = "GEOMILL_DATA_LOGGER_PATH";

// Dumps every incoming call to a directory for offline reproduction:
// <stamp>.json with the config and buffer sizes, and <stamp>.<n>.obj per
// input model. Failures to write are logged and otherwise ignored so a
// broken dump directory never changes the result of a call.
class DataLogger {
public:
    explicit DataLogger(std::filesystem::path directory);

    // Logger for GEOMILL_DATA_LOGGER_PATH, or nullopt when unset or not a
    // directory
    static std::optional<DataLogger> from_environment();

    // Returns the stamp used for the files, empty when nothing was written
    std::string record(const ConfigMap& config, const GeometryBuffer& input) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

}  // namespace geomill

#endif // GEOMILL_DISPATCH_DATA_LOGGER_HPP
