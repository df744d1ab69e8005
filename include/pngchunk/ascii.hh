/**
 * @file ascii.hh
 * @brief Locale independent ASCII character classification
 *
 * The <cctype> functions depend on the current C locale and are not
 * constexpr, so chunk type validation uses these instead.
 */

#pragma once

#include <cstdint>

namespace pngchunk::ascii {

    constexpr bool is_upper(std::uint8_t c) noexcept {
        return c >= 'A' && c <= 'Z';
    }

    constexpr bool is_lower(std::uint8_t c) noexcept {
        return c >= 'a' && c <= 'z';
    }

    constexpr bool is_alpha(std::uint8_t c) noexcept {
        return is_upper(c) || is_lower(c);
    }

    // True for the 7-bit range, NUL included
    constexpr bool is_ascii(std::uint8_t c) noexcept {
        return c < 0x80;
    }

} // namespace pngchunk::ascii
