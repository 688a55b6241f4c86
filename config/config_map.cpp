#include "config_map.hpp"

namespace geomill {

ConfigMap::ConfigMap(std::initializer_list<Storage::value_type> entries) {
    for (const auto& [key, value] : entries) {
        entries_[key] = value;
    }
}

std::optional<std::string> ConfigMap::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ConfigMap::has(const std::string& key) const {
    return entries_.count(key) > 0;
}

bool ConfigMap::insert(const std::string& key, const std::string& value) {
    return entries_.emplace(key, value).second;
}

void ConfigMap::set(const std::string& key, const std::string& value) {
    entries_[key] = value;
}

std::vector<std::string> ConfigMap::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace geomill
