#ifndef GEOMILL_COMMON_FILE_IO_HPP
#define GEOMILL_COMMON_FILE_IO_HPP

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace geomill {

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

}  // namespace geomill

#endif // GEOMILL_COMMON_FILE_IO_HPP
