#pragma once

#include <export.hpp>

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
RUNESTREAM_API const char* runestream_get_last_error();
RUNESTREAM_API const char* runestream_get_version();

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* rs_builder_t;

// =============================================================================
//  UTF-8 Builder
// =============================================================================

RUNESTREAM_API rs_builder_t runestream_builder_create();
RUNESTREAM_API rs_builder_t runestream_builder_with_capacity(size_t capacity);
// text must already be valid UTF-8
RUNESTREAM_API rs_builder_t runestream_builder_from_str(const char* text, size_t len);
RUNESTREAM_API void runestream_builder_destroy(rs_builder_t handle);

RUNESTREAM_API bool runestream_builder_reserve(rs_builder_t handle, size_t additional);
RUNESTREAM_API bool runestream_builder_push(rs_builder_t handle, uint8_t byte);
// text must already be valid UTF-8
RUNESTREAM_API bool runestream_builder_push_str(rs_builder_t handle, const char* text, size_t len);
RUNESTREAM_API bool runestream_builder_push_char(rs_builder_t handle, uint32_t codepoint);
RUNESTREAM_API bool runestream_builder_push_chunk(rs_builder_t handle, const uint8_t* data, size_t len);

// Queries return false / 0 for a null handle.
RUNESTREAM_API bool runestream_builder_is_valid(rs_builder_t handle);
RUNESTREAM_API size_t runestream_builder_len(rs_builder_t handle);
RUNESTREAM_API bool runestream_builder_is_empty(rs_builder_t handle);

// Always destroys the handle. On success *out_text is a NUL-terminated copy of
// the *out_len assembled bytes, released with runestream_free_string().
RUNESTREAM_API bool runestream_builder_finalize(rs_builder_t handle, char** out_text, size_t* out_len);
RUNESTREAM_API void runestream_free_string(char* text);

// =============================================================================
//  Assembly
// =============================================================================

typedef struct RSAssemblyStats {
    size_t bytes_read;
    size_t chunks;
    size_t codepoints;
    double elapsed_ms;
} RSAssemblyStats;

RUNESTREAM_API bool runestream_assemble_file(const char* file_path, size_t chunk_size,
                                             char** out_text, size_t* out_len,
                                             RSAssemblyStats* out_stats);

#ifdef __cplusplus
}
#endif
