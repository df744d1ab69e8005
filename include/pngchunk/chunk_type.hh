/**
 * @file chunk_type.hh
 * @brief PNG chunk type tag
 *
 * A chunk type is four bytes naming the role of a chunk inside a PNG
 * stream. The case of each letter carries one property bit:
 *
 *   byte 0  uppercase = critical
 *   byte 1  uppercase = public
 *   byte 2  uppercase = reserved bit valid
 *   byte 3  lowercase = safe to copy
 *
 * Instances can only be obtained through the validating factories or the
 * _chunk literal, so a chunk_type never holds a non-letter in bytes 0..2.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/ascii.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {
    class chunk_type;

    constexpr chunk_type operator""_chunk(const char* str, std::size_t len);

    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Construct from 4 raw bytes
         * @param bytes Bytes as found in the chunk header
         * @throws invalid_character if any of bytes 0..2 is not an ASCII letter
         *
         * Byte 3 is taken as is.
         */
        static chunk_type from_bytes(const bytes_type& bytes);

        /**
         * @brief Construct from 4 bytes read from a buffer
         * @param data Pointer to at least 4 readable bytes
         * @throws invalid_character if any of bytes 0..2 is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Construct from a 32-bit value in network byte order
         * @param value Chunk type with byte 0 in the most significant position
         * @throws invalid_character if any of bytes 0..2 is not an ASCII letter
         */
        static chunk_type from_uint32(std::uint32_t value);

        /**
         * @brief Construct from text
         * @param text At most 4 ASCII letters
         * @throws too_long if text is longer than 4 characters
         * @throws invalid_character if text contains a non-letter
         *
         * Text shorter than 4 characters leaves the remaining bytes zero.
         */
        static chunk_type from_string(std::string_view text);

        [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return b_; }

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const { return b_[i]; }

        [[nodiscard]] constexpr bool is_critical() const noexcept {
            return ascii::is_upper(b_[0]);
        }

        [[nodiscard]] constexpr bool is_public() const noexcept {
            return ascii::is_upper(b_[1]);
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept {
            return ascii::is_upper(b_[2]);
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept {
            return ascii::is_lower(b_[3]);
        }

        /**
         * @brief Check bytes 0..2 are letters and the reserved bit is valid
         *
         * The reserved bit is tested on every iteration, so the net rule is
         * byte 2 uppercase with bytes 0 and 1 letters of either case.
         * Byte 3 is not examined.
         */
        [[nodiscard]] constexpr bool is_valid() const noexcept {
            for (std::size_t i = 0; i < 3; ++i) {
                if (!ascii::is_alpha(b_[i]) || !is_reserved_bit_valid()) {
                    return false;
                }
            }
            return true;
        }

        // Network byte order, byte 0 in the most significant position
        [[nodiscard]] std::uint32_t to_uint32() const noexcept;

        // Write the 4 bytes to dest
        void to_bytes(void* dest) const;

        /**
         * @brief Render as 4 ASCII characters
         * @throws ascii_error if a byte is outside the 7-bit range
         *
         * Zero padding from short text is kept as NUL characters.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk_type& o) const { return b_ == o.b_; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }

    private:
        constexpr explicit chunk_type(const bytes_type& b) noexcept
            : b_(b) {}

        friend constexpr chunk_type operator""_chunk(const char* str, std::size_t len);

        bytes_type b_;
    };

    // Writes to_string(), so it throws ascii_error on non-ASCII bytes
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    /**
     * @brief Compile-time chunk type from text
     *
     * Follows the from_string() rules. In a constant expression a bad
     * literal fails compilation; otherwise it throws like from_string().
     */
    constexpr chunk_type operator""_chunk(const char* str, std::size_t len) {
        if (len > 4) {
            throw too_long("chunk type literal must be 4 characters or less");
        }
        chunk_type::bytes_type b{};
        for (std::size_t i = 0; i < len; ++i) {
            auto c = static_cast<std::uint8_t>(str[i]);
            if (!ascii::is_alpha(c)) {
                throw invalid_character("chunk type literal must only consist of ASCII letters");
            }
            b[i] = c;
        }
        return chunk_type(b);
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
