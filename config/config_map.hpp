#ifndef GEOMILL_CONFIG_CONFIG_MAP_HPP
#define GEOMILL_CONFIG_CONFIG_MAP_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geomill {

// Reserved keys shared by every command
namespace keys {
    constexpr const char* COMMAND = "command";
    constexpr const char* ERROR_KEY = "error";
    constexpr const char* MESH_FORMAT = "mesh.format";
}

// Flat string-to-string mapping. Keys are unique and iterate in sorted order,
// so encoding a map is deterministic.
class ConfigMap {
public:
    using Storage = std::map<std::string, std::string>;

    ConfigMap() = default;
    ConfigMap(std::initializer_list<Storage::value_type> entries);

    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const;

    // Adds a new key; returns false and leaves the map unchanged if the key
    // is already present.
    bool insert(const std::string& key, const std::string& value);

    // Adds or replaces a key. Operations use this to build their output.
    void set(const std::string& key, const std::string& value);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    Storage::const_iterator begin() const { return entries_.begin(); }
    Storage::const_iterator end() const { return entries_.end(); }

    std::vector<std::string> keys() const;

    bool operator==(const ConfigMap& other) const { return entries_ == other.entries_; }

private:
    Storage entries_;
};

}  // namespace geomill

#endif // GEOMILL_CONFIG_CONFIG_MAP_HPP
