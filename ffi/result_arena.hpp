#ifndef GEOMILL_FFI_RESULT_ARENA_HPP
#define GEOMILL_FFI_RESULT_ARENA_HPP

#include <ffi/geomill_api.h>
#include <operations/operation_result.hpp>
#include <memory>

namespace geomill::ffi {

// Owns every allocation of a ProcessResult. A result is staged in an arena
// while it is being encoded, handed to the host with release(), and comes
// back through adopt() when the host frees it; destroying the arena is the
// single teardown for all of its buffers and strings.
class ResultArena {
public:
    // Copies geometry and config into arena-owned buffers. Empty buffers
    // stay null with a zero count.
    explicit ResultArena(const OperationResult& result);

    // Takes back a result previously released to the host and zeroes it
    static ResultArena adopt(ProcessResult& result) noexcept;

    ~ResultArena();

    ResultArena(ResultArena&&) noexcept = default;
    ResultArena& operator=(ResultArena&&) = delete;
    ResultArena(const ResultArena&) = delete;
    ResultArena& operator=(const ResultArena&) = delete;

    // Transfers ownership of every buffer to the returned structure
    ProcessResult release() noexcept;

    // Number of separately owned allocations
    size_t allocation_count() const;

private:
    ResultArena() = default;

    // Frees the key and value strings; the arrays themselves are unique_ptrs
    void free_strings() noexcept;

    std::unique_ptr<GeomillVector3[]> vertices_;
    size_t vertex_count_ = 0;
    std::unique_ptr<uint32_t[]> indices_;
    size_t index_count_ = 0;
    std::unique_ptr<float[]> matrices_;
    size_t matrix_count_ = 0;

    // Each non-null entry is a new[]-allocated string owned by the arena
    std::unique_ptr<char*[]> keys_;
    std::unique_ptr<char*[]> values_;
    size_t entry_count_ = 0;
};

}  // namespace geomill::ffi

#endif // GEOMILL_FFI_RESULT_ARENA_HPP
