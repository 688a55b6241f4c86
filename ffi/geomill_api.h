#ifndef GEOMILL_FFI_GEOMILL_API_H
#define GEOMILL_FFI_GEOMILL_API_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#  if defined(GEOMILL_BUILDING_LIBRARY)
#    define GEOMILL_API __declspec(dllexport)
#  else
#    define GEOMILL_API __declspec(dllimport)
#  endif
#else
#  define GEOMILL_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef struct GeomillVector3 {
    float x;
    float y;
    float z;
} GeomillVector3;

/* Parallel arrays of null-terminated strings */
typedef struct StringMap {
    char** keys;
    char** values;
    size_t count;
} StringMap;

/* Counts are element counts: vertices, indices, and matrix floats
   (16 per matrix, column-major). */
typedef struct GeometryOutput {
    GeomillVector3* vertices;
    size_t vertex_count;
    uint32_t* indices;
    size_t index_count;
    float* matrices;
    size_t matrix_count;
} GeometryOutput;

typedef struct ProcessResult {
    GeometryOutput geometry;
    StringMap map;
} ProcessResult;

/* Runs the command named by the "command" key. Never fails: errors are
   reported under the "error" key of the returned map with empty geometry.
   Input buffers are copied and not retained. The result must be released
   exactly once with free_process_result. */
GEOMILL_API ProcessResult process_geometry(const GeomillVector3* vertices, size_t vertex_count,
                                           const uint32_t* indices, size_t index_count,
                                           const float* matrices, size_t matrix_count,
                                           const StringMap* config);

/* Frees every buffer and string of a result and zeroes it. NULL is a no-op. */
GEOMILL_API void free_process_result(ProcessResult* result);

/* Static string, not to be freed */
GEOMILL_API const char* geomill_version(void);

#ifdef __cplusplus
}
#endif

#endif /* GEOMILL_FFI_GEOMILL_API_H */
