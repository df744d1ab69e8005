//
// Chunk type construction and rendering
//

#include <pngchunk/chunk_type.hh>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngchunk {
    namespace {
        std::string hex_byte(std::uint8_t v) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(v);
            return oss.str();
        }
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        // byte 3 is not checked here, only the text path checks every character
        for (std::size_t i = 0; i < 3; ++i) {
            if (!ascii::is_alpha(bytes[i])) {
                THROW_INVALID_CHARACTER("chunk type byte ", i, " (", hex_byte(bytes[i]),
                                        ") is not an ASCII letter");
            }
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes;
        std::memcpy(bytes.data(), data, 4);
        return from_bytes(bytes);
    }

    chunk_type chunk_type::from_uint32(std::uint32_t value) {
        return from_bytes(bytes_type{
            static_cast<std::uint8_t>(value >> 24),
            static_cast<std::uint8_t>(value >> 16),
            static_cast<std::uint8_t>(value >> 8),
            static_cast<std::uint8_t>(value)
        });
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_TOO_LONG_IF(text.size() > 4,
                          "chunk type '", text, "' is ", text.size(),
                          " characters long, at most 4 allowed");

        bytes_type bytes{};
        for (std::size_t i = 0; i < text.size(); ++i) {
            auto c = static_cast<std::uint8_t>(text[i]);
            if (!ascii::is_alpha(c)) {
                THROW_INVALID_CHARACTER("chunk type '", text, "' character ", i,
                                        " (", hex_byte(c), ") is not an ASCII letter");
            }
            bytes[i] = c;
        }
        return chunk_type(bytes);
    }

    std::uint32_t chunk_type::to_uint32() const noexcept {
        return (std::uint32_t(b_[0]) << 24) | (std::uint32_t(b_[1]) << 16) |
               (std::uint32_t(b_[2]) << 8) | std::uint32_t(b_[3]);
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, b_.data(), 4);
    }

    std::string chunk_type::to_string() const {
        for (std::size_t i = 0; i < b_.size(); ++i) {
            THROW_ASCII_UNLESS(ascii::is_ascii(b_[i]),
                               "cannot render chunk type: byte ", i, " (",
                               hex_byte(b_[i]), ") is not ASCII");
        }
        return {reinterpret_cast<const char*>(b_.data()), b_.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << t.to_string();
    }

} // namespace pngchunk
