#include <interop_api.h>
#include <unicode/utf8_builder.hpp>
#include <ingestion/text_assembler.hpp>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

// Thread-local error storage
thread_local std::string g_last_error;

const char* runestream_get_last_error() {
    return g_last_error.c_str();
}

const char* runestream_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

using Runestream::Utf8Builder;

static Utf8Builder& builder_ref(rs_builder_t handle) {
    if (!handle) throw std::invalid_argument("Invalid builder handle");
    return *static_cast<Utf8Builder*>(handle);
}

// Copies text into a malloc'd, NUL-terminated buffer owned by the caller.
static void export_text(const std::string& text, char** out_text, size_t* out_len) {
    char* copy = static_cast<char*>(std::malloc(text.size() + 1));
    if (!copy) throw std::bad_alloc();
    std::memcpy(copy, text.data(), text.size());
    copy[text.size()] = '\0';
    *out_text = copy;
    *out_len = text.size();
}

// =============================================================================
//  UTF-8 Builder
// =============================================================================

rs_builder_t runestream_builder_create() {
    INTEROP_TRY_CATCH_PTR({
        return static_cast<rs_builder_t>(new Utf8Builder());
    })
}

rs_builder_t runestream_builder_with_capacity(size_t capacity) {
    INTEROP_TRY_CATCH_PTR({
        return static_cast<rs_builder_t>(new Utf8Builder(Utf8Builder::with_capacity(capacity)));
    })
}

rs_builder_t runestream_builder_from_str(const char* text, size_t len) {
    INTEROP_TRY_CATCH_PTR({
        if (!text && len != 0) throw std::invalid_argument("Invalid parameters");
        return static_cast<rs_builder_t>(new Utf8Builder(std::string_view(text ? text : "", len)));
    })
}

void runestream_builder_destroy(rs_builder_t handle) {
    if (handle) {
        delete static_cast<Utf8Builder*>(handle);
    }
}

bool runestream_builder_reserve(rs_builder_t handle, size_t additional) {
    INTEROP_TRY_CATCH({
        builder_ref(handle).reserve(additional);
        return true;
    })
}

bool runestream_builder_push(rs_builder_t handle, uint8_t byte) {
    INTEROP_TRY_CATCH({
        builder_ref(handle).push(byte);
        return true;
    })
}

bool runestream_builder_push_str(rs_builder_t handle, const char* text, size_t len) {
    INTEROP_TRY_CATCH({
        if (!text && len != 0) throw std::invalid_argument("Invalid parameters");
        builder_ref(handle).push_str(std::string_view(text ? text : "", len));
        return true;
    })
}

bool runestream_builder_push_char(rs_builder_t handle, uint32_t codepoint) {
    INTEROP_TRY_CATCH({
        builder_ref(handle).push_char(static_cast<char32_t>(codepoint));
        return true;
    })
}

bool runestream_builder_push_chunk(rs_builder_t handle, const uint8_t* data, size_t len) {
    INTEROP_TRY_CATCH({
        if (!data && len != 0) throw std::invalid_argument("Invalid parameters");
        builder_ref(handle).push_chunk(data, len);
        return true;
    })
}

bool runestream_builder_is_valid(rs_builder_t handle) {
    if (!handle) return false;
    return static_cast<Utf8Builder*>(handle)->is_valid();
}

size_t runestream_builder_len(rs_builder_t handle) {
    if (!handle) return 0;
    return static_cast<Utf8Builder*>(handle)->len();
}

bool runestream_builder_is_empty(rs_builder_t handle) {
    if (!handle) return false;
    return static_cast<Utf8Builder*>(handle)->is_empty();
}

bool runestream_builder_finalize(rs_builder_t handle, char** out_text, size_t* out_len) {
    std::unique_ptr<Utf8Builder> builder(static_cast<Utf8Builder*>(handle));
    INTEROP_TRY_CATCH({
        if (!builder || !out_text || !out_len) throw std::invalid_argument("Invalid parameters");
        export_text(std::move(*builder).finalize(), out_text, out_len);
        return true;
    })
}

void runestream_free_string(char* text) {
    std::free(text);
}

// =============================================================================
//  Assembly
// =============================================================================

bool runestream_assemble_file(const char* file_path, size_t chunk_size,
                              char** out_text, size_t* out_len,
                              RSAssemblyStats* out_stats) {
    INTEROP_TRY_CATCH({
        if (!file_path || !out_text || !out_len || !out_stats) throw std::invalid_argument("Invalid parameters");

        Runestream::AssemblyConfig config;
        config.chunk_size = chunk_size;
        Runestream::TextAssembler assembler(config);
        auto result = assembler.assemble_file(file_path);

        export_text(result.text, out_text, out_len);
        out_stats->bytes_read = result.stats.bytes_read;
        out_stats->chunks = result.stats.chunks;
        out_stats->codepoints = result.stats.codepoints;
        out_stats->elapsed_ms = result.stats.elapsed_ms;

        return true;
    })
}
