/**
 * @file utf8_builder.hpp
 * @brief Incremental UTF-8 validation and assembly
 *
 * Accepts a byte stream in arbitrary fragments (single bytes, trusted
 * strings, single characters, raw chunks) and keeps only complete,
 * validated characters in one contiguous buffer. A character split across
 * fragment boundaries is held in a small side array until its last
 * continuation byte arrives.
 *
 * States:
 *   Complete  pending_len == 0, every byte seen so far forms whole characters
 *   Pending   pending_len  > 0, expected_len - pending_len bytes still missing
 */

#pragma once

#include <export.hpp>
#include <unicode/utf8_error.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Runestream {

/**
 * @brief Builds and validates UTF-8 text from chunks.
 *
 * Every push operation throws Utf8Error on rejected input. After a throw the
 * builder must be discarded: push_chunk does not roll back characters it
 * already appended during the failing call.
 */
class RUNESTREAM_API Utf8Builder {
public:
    Utf8Builder() = default;

    /**
     * @brief Seed from text already known to be valid UTF-8.
     */
    explicit Utf8Builder(std::string_view valid);
    explicit Utf8Builder(std::string&& valid);

    static Utf8Builder with_capacity(size_t capacity);

    /**
     * @brief Reserve room for at least @p additional more bytes. Hint only.
     */
    void reserve(size_t additional);

    /**
     * @brief Bytes held, including those of a pending incomplete character.
     */
    size_t len() const { return buffer_.size() + pending_len_; }

    bool is_empty() const { return buffer_.empty() && pending_len_ == 0; }

    /**
     * @brief True when no multi-byte character is waiting for continuation bytes.
     */
    bool is_valid() const { return pending_len_ == 0; }

    /**
     * @brief Take the assembled text, consuming the builder.
     * @throws Utf8Error if the input ended in the middle of a character
     */
    std::string finalize() &&;

    /**
     * @brief Push one byte.
     *
     * In Complete state the byte must be ASCII or a lead byte; in Pending state
     * it must be a legal continuation byte for the pending lead. A rejected
     * byte leaves the builder unchanged.
     */
    void push(uint8_t b);

    /**
     * @brief Append text the caller guarantees to be valid UTF-8.
     * @throws Utf8Error if a character is pending
     */
    void push_str(std::string_view s);

    /**
     * @brief Append one Unicode scalar value.
     * @throws Utf8Error if a character is pending, or @p c is a surrogate or above U+10FFFF
     */
    void push_char(char32_t c);

    /**
     * @brief Push an arbitrary chunk of bytes; may begin or end mid-character.
     * @param data Chunk bytes
     * @param len Length in bytes (0 is a no-op)
     */
    void push_chunk(const void* data, size_t len);

    void push_chunk(std::string_view chunk) {
        push_chunk(chunk.data(), chunk.size());
    }

    void push_chunk(const std::vector<uint8_t>& chunk) {
        push_chunk(chunk.data(), chunk.size());
    }

private:
    static void check_continuation(uint8_t lead, const uint8_t* bytes, size_t count, size_t first_index);
    void flush_pending();

    std::string buffer_;
    std::array<uint8_t, 3> pending_{};  // bytes of the incomplete character, lead first
    uint8_t pending_len_ = 0;
    uint8_t expected_len_ = 0;          // meaningful only while pending_len_ > 0
};

} // namespace Runestream
