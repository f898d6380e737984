/**
 * @file text_assembler.cpp
 * @brief Chunked stream assembly on top of Utf8Builder.
 */

#include <ingestion/text_assembler.hpp>
#include <unicode/utf8_width.hpp>
#include <utils/time.hpp>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Runestream {

namespace {

size_t parse_size_env(const char* name, size_t fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    size_t parsed = 0;
    const char* end = value + std::strlen(value);
    auto [ptr, ec] = std::from_chars(value, end, parsed);
    if (ec != std::errc() || ptr != end) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    return parsed;
}

void validate(const AssemblyConfig& config) {
    if (config.chunk_size == 0) throw std::invalid_argument("chunk_size must be at least 1");
}

size_t count_codepoints(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (!is_continuation(static_cast<uint8_t>(c))) ++count;
    }
    return count;
}

} // namespace

AssemblyConfig AssemblyConfig::load_from_env() {
    AssemblyConfig config;
    config.chunk_size = parse_size_env("RUNESTREAM_CHUNK_SIZE", config.chunk_size);
    config.reserve_bytes = parse_size_env("RUNESTREAM_RESERVE_BYTES", config.reserve_bytes);
    validate(config);
    return config;
}

TextAssembler::TextAssembler(const AssemblyConfig& config)
    : config_(config) {
    validate(config_);
}

void TextAssembler::set_config(const AssemblyConfig& config) {
    validate(config);
    config_ = config;
}

AssemblyResult TextAssembler::assemble(std::istream& in) {
    Timer timer;
    AssemblyResult result;

    Utf8Builder builder = Utf8Builder::with_capacity(config_.reserve_bytes);
    std::vector<char> chunk(config_.chunk_size);

    for (;;) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (got > 0) {
            builder.push_chunk(chunk.data(), got);
            result.stats.bytes_read += got;
            result.stats.chunks++;
        }
        if (!in) break;
    }
    if (in.bad()) throw std::runtime_error("Read failed");

    result.text = std::move(builder).finalize();
    result.stats.codepoints = count_codepoints(result.text);
    result.stats.elapsed_ms = timer.elapsed_ms();
    return result;
}

AssemblyResult TextAssembler::assemble_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Open failed: " + path);
    return assemble(file);
}

} // namespace Runestream
