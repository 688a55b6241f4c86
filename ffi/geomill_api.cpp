#include "geomill_api.h"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <dispatch/dispatcher.hpp>
#include <ffi/marshal.hpp>
#include <ffi/result_arena.hpp>
#include <string>

namespace {

// Encodes `result`, falling back to a bare error result and finally to an
// all-null result if memory runs out while encoding.
ProcessResult encode(const geomill::OperationResult& result) noexcept {
    try {
        return geomill::ffi::ResultArena(result).release();
    } catch (const std::exception& e) {
        try {
            geomill::logging::get_logger()->error("could not encode result: {}", e.what());
            return geomill::ffi::ResultArena(geomill::error_result("could not encode result")).release();
        } catch (const std::exception&) {
            // Nothing can be allocated; an all-null result is still valid to free
            return ProcessResult{};
        }
    }
}

}  // namespace

extern "C" {

GEOMILL_API ProcessResult process_geometry(const GeomillVector3* vertices, size_t vertex_count,
                                           const uint32_t* indices, size_t index_count,
                                           const float* matrices, size_t matrix_count,
                                           const StringMap* config) {
    try {
        auto log = geomill::logging::get_logger();
        try {
            geomill::ConfigMap config_map = geomill::ffi::decode_config(config);
            geomill::GeometryBuffer input = geomill::ffi::decode_geometry(
                vertices, vertex_count, indices, index_count, matrices, matrix_count);

            static const geomill::Dispatcher dispatcher;
            return encode(dispatcher.process(config_map, input));
        } catch (const geomill::DecodeError& e) {
            log->warn("decode error: {}", e.what());
            return encode(geomill::error_result(e.what()));
        } catch (const std::exception& e) {
            log->error("process_geometry failed: {}", e.what());
            return encode(geomill::error_result(std::string("internal failure: ") + e.what()));
        } catch (...) {
            log->error("process_geometry failed with a non-standard exception");
            return encode(geomill::error_result("internal failure: unknown exception"));
        }
    } catch (const std::exception&) {
        // The logger itself could not be created
        return encode(geomill::error_result("internal failure: logging unavailable"));
    }
}

GEOMILL_API void free_process_result(ProcessResult* result) {
    if (result == nullptr) {
        return;
    }
    // Destroying the adopted arena frees every buffer and string
    geomill::ffi::ResultArena::adopt(*result);
}

GEOMILL_API const char* geomill_version(void) {
    return GEOMILL_VERSION;
}

}  // extern "C"
