#pragma once

#include <stdexcept>

namespace Runestream {

/**
 * @brief The byte sequence cannot be (or did not end as) well-formed UTF-8.
 *
 * Thrown by every Utf8Builder operation that rejects input. A builder that
 * threw must be discarded.
 */
class Utf8Error : public std::runtime_error {
public:
    Utf8Error() : std::runtime_error("incorrect UTF-8 data") {}
};

} // namespace Runestream
