/**
 * @file utf8_builder.cpp
 * @brief Utf8Builder state machine.
 */

#include <unicode/utf8_builder.hpp>
#include <unicode/utf8_width.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cstring>
#include <utility>

namespace Runestream {

Utf8Builder::Utf8Builder(std::string_view valid)
    : buffer_(valid) {}

Utf8Builder::Utf8Builder(std::string&& valid)
    : buffer_(std::move(valid)) {}

Utf8Builder Utf8Builder::with_capacity(size_t capacity) {
    Utf8Builder builder;
    builder.buffer_.reserve(capacity);
    return builder;
}

void Utf8Builder::reserve(size_t additional) {
    buffer_.reserve(buffer_.size() + additional);
}

std::string Utf8Builder::finalize() && {
    if (!is_valid()) throw Utf8Error();

    std::string text = std::move(buffer_);
    buffer_.clear();
    return text;
}

// bytes[i] sits at position first_index + i of the character led by lead
void Utf8Builder::check_continuation(uint8_t lead, const uint8_t* bytes, size_t count, size_t first_index) {
    for (size_t i = 0; i < count; ++i) {
        if (!is_valid_continuation(lead, first_index + i, bytes[i])) throw Utf8Error();
    }
}

void Utf8Builder::flush_pending() {
    buffer_.append(reinterpret_cast<const char*>(pending_.data()), pending_len_);
    pending_len_ = 0;
}

void Utf8Builder::push(uint8_t b) {
    if (pending_len_ == 0) {
        const size_t width = utf8_width(b);
        switch (width) {
            case 0:
                throw Utf8Error();
            case 1:
                buffer_.push_back(static_cast<char>(b));
                break;
            default:
                pending_[0] = b;
                pending_len_ = 1;
                expected_len_ = static_cast<uint8_t>(width);
                break;
        }
        return;
    }

    check_continuation(pending_[0], &b, 1, pending_len_);

    if (pending_len_ + 1 == expected_len_) {
        flush_pending();
        buffer_.push_back(static_cast<char>(b));
    } else {
        pending_[pending_len_++] = b;
    }
}

void Utf8Builder::push_str(std::string_view s) {
    if (pending_len_ != 0) throw Utf8Error();
    buffer_.append(s.data(), s.size());
}

void Utf8Builder::push_char(char32_t c) {
    if (pending_len_ != 0 || !is_scalar_value(c)) throw Utf8Error();

    char units[4];
    buffer_.append(units, encode_utf8(c, units));
}

void Utf8Builder::push_chunk(const void* data, size_t len) {
    if (len == 0) return;

    const auto* chunk = static_cast<const uint8_t*>(data);
    size_t offset = 0;

    // Resume a character left incomplete by the previous fragment.
    if (pending_len_ != 0) {
        const size_t remaining = expected_len_ - pending_len_;
        check_continuation(pending_[0], chunk, std::min(remaining, len), pending_len_);

        if (len < remaining) {
            std::memcpy(pending_.data() + pending_len_, chunk, len);
            pending_len_ = static_cast<uint8_t>(pending_len_ + len);
            return;
        }

        flush_pending();
        buffer_.append(reinterpret_cast<const char*>(chunk), remaining);
        if (len == remaining) return;
        offset = remaining;
    }

    for (;;) {
        const uint8_t lead = chunk[offset];
        const size_t width = utf8_width(lead);
        if (width == 0) throw Utf8Error();

        const size_t available = len - offset;
        check_continuation(lead, chunk + offset + 1, std::min(width, available) - 1, 1);

        if (available < width) {
            // Split by the chunk boundary: keep the head for the next fragment.
            std::memcpy(pending_.data(), chunk + offset, available);
            pending_len_ = static_cast<uint8_t>(available);
            expected_len_ = static_cast<uint8_t>(width);
            return;
        }

        buffer_.append(reinterpret_cast<const char*>(chunk + offset), width);
        offset += width;
        if (offset == len) return;
    }
}

} // namespace Runestream
