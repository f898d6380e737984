/**
 * @file text_assembler.hpp
 * @brief Chunked UTF-8 assembly of streams and files
 *
 * Reads input in fixed-size chunks and feeds each one to a Utf8Builder, so
 * characters are routinely split across read boundaries. Produces the
 * validated text together with statistics about the run.
 */

#pragma once

#include <export.hpp>
#include <unicode/utf8_builder.hpp>
#include <cstddef>
#include <istream>
#include <string>

namespace Runestream {

/**
 * @brief Assembly configuration
 */
struct RUNESTREAM_API AssemblyConfig {
    size_t chunk_size = 4096;   // Bytes per read, >= 1
    size_t reserve_bytes = 0;   // Initial buffer capacity hint

    /**
     * @brief Defaults overridden by RUNESTREAM_CHUNK_SIZE and RUNESTREAM_RESERVE_BYTES.
     * @throws std::invalid_argument on a malformed value or a zero chunk size
     */
    static AssemblyConfig load_from_env();
};

/**
 * @brief Assembly statistics
 */
struct AssemblyStats {
    size_t bytes_read = 0;
    size_t chunks = 0;
    size_t codepoints = 0;
    double elapsed_ms = 0.0;
};

struct AssemblyResult {
    std::string text;
    AssemblyStats stats;
};

class RUNESTREAM_API TextAssembler {
public:
    /**
     * @throws std::invalid_argument if config.chunk_size is 0
     */
    explicit TextAssembler(const AssemblyConfig& config = AssemblyConfig());

    /**
     * @brief Assemble everything remaining in @p in
     * @throws Utf8Error if the bytes are not well-formed UTF-8
     * @throws std::runtime_error if the stream fails
     */
    AssemblyResult assemble(std::istream& in);

    /**
     * @brief Assemble a file, read in binary mode
     */
    AssemblyResult assemble_file(const std::string& path);

    const AssemblyConfig& config() const { return config_; }
    void set_config(const AssemblyConfig& config);

private:
    AssemblyConfig config_;
};

} // namespace Runestream
