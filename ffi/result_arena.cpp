#include "result_arena.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace geomill::ffi {

namespace {

template <typename T>
std::unique_ptr<T[]> copy_array(const T* data, size_t count) {
    if (count == 0) {
        return nullptr;
    }
    auto out = std::make_unique<T[]>(count);
    std::copy(data, data + count, out.get());
    return out;
}

// The arena stores the string as a raw pointer and frees it with delete[]
char* copy_string(const std::string& text) {
    auto out = std::make_unique<char[]>(text.size() + 1);
    std::memcpy(out.get(), text.c_str(), text.size() + 1);
    return out.release();
}

}  // namespace

ResultArena::ResultArena(const OperationResult& result) {
    const GeometryBuffer& geometry = result.geometry;

    vertex_count_ = geometry.vertices.size();
    if (vertex_count_ > 0) {
        vertices_ = std::make_unique<GeomillVector3[]>(vertex_count_);
        for (size_t i = 0; i < vertex_count_; ++i) {
            const Vec3& v = geometry.vertices[i];
            vertices_[i] = GeomillVector3{v.x, v.y, v.z};
        }
    }
    indices_ = copy_array(geometry.indices.data(), geometry.indices.size());
    index_count_ = geometry.indices.size();
    matrices_ = copy_array(geometry.matrices.data(), geometry.matrices.size());
    matrix_count_ = geometry.matrices.size();

    if (result.config.empty()) {
        return;
    }
    // Zero-initialized so a failed copy leaves only valid or null entries
    keys_ = std::make_unique<char*[]>(result.config.size());
    values_ = std::make_unique<char*[]>(result.config.size());
    entry_count_ = result.config.size();
    try {
        size_t i = 0;
        for (const auto& [key, value] : result.config) {
            keys_[i] = copy_string(key);
            values_[i] = copy_string(value);
            ++i;
        }
    } catch (const std::bad_alloc&) {
        // The destructor does not run for a throwing constructor
        free_strings();
        throw;
    }
}

ResultArena::~ResultArena() {
    free_strings();
}

void ResultArena::free_strings() noexcept {
    for (size_t i = 0; i < entry_count_; ++i) {
        if (keys_) {
            delete[] keys_[i];
            keys_[i] = nullptr;
        }
        if (values_) {
            delete[] values_[i];
            values_[i] = nullptr;
        }
    }
}

ResultArena ResultArena::adopt(ProcessResult& result) noexcept {
    ResultArena arena;
    arena.vertices_.reset(result.geometry.vertices);
    arena.vertex_count_ = result.geometry.vertex_count;
    arena.indices_.reset(result.geometry.indices);
    arena.index_count_ = result.geometry.index_count;
    arena.matrices_.reset(result.geometry.matrices);
    arena.matrix_count_ = result.geometry.matrix_count;
    arena.keys_.reset(result.map.keys);
    arena.values_.reset(result.map.values);
    arena.entry_count_ = result.map.count;

    result = ProcessResult{};
    return arena;
}

ProcessResult ResultArena::release() noexcept {
    ProcessResult result{};
    result.geometry.vertices = vertices_.release();
    result.geometry.vertex_count = result.geometry.vertices ? vertex_count_ : 0;
    result.geometry.indices = indices_.release();
    result.geometry.index_count = result.geometry.indices ? index_count_ : 0;
    result.geometry.matrices = matrices_.release();
    result.geometry.matrix_count = result.geometry.matrices ? matrix_count_ : 0;

    result.map.keys = keys_.release();
    result.map.values = values_.release();
    result.map.count = result.map.keys ? entry_count_ : 0;

    vertex_count_ = index_count_ = matrix_count_ = entry_count_ = 0;
    return result;
}

size_t ResultArena::allocation_count() const {
    size_t count = 0;
    count += vertices_ ? 1 : 0;
    count += indices_ ? 1 : 0;
    count += matrices_ ? 1 : 0;
    for (size_t i = 0; i < entry_count_; ++i) {
        count += (keys_ && keys_[i]) ? 1 : 0;
        count += (values_ && values_[i]) ? 1 : 0;
    }
    count += keys_ ? 1 : 0;
    count += values_ ? 1 : 0;
    return count;
}

}  // namespace geomill::ffi
