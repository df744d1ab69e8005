/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for libpngchunk
 *
 * Every recoverable error raised by the library derives from
 * pngchunk_error. Contract violations (ascii_error) derive from
 * std::logic_error instead and are not meant to be handled.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all recoverable libpngchunk errors
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class invalid_character
     * @brief A byte or character of a chunk type is not an ASCII letter
     */
    class invalid_character : public pngchunk_error {
    public:
        explicit invalid_character(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class too_long
     * @brief Text given for a chunk type is longer than 4 characters
     */
    class too_long : public pngchunk_error {
    public:
        explicit too_long(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class validation_error
     * @brief A chunk type failed the strict conformance check
     *
     * Thrown by check() when check_options::strict is set.
     */
    class validation_error : public pngchunk_error {
    public:
        explicit validation_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class ascii_error
     * @brief A chunk type holding non-ASCII bytes was rendered as text
     *
     * Raw byte construction does not check the fourth byte, so this can
     * only be reached by rendering such a tag. It signals a defect in
     * the caller, not a malformed input.
     */
    class ascii_error : public std::logic_error {
    public:
        explicit ascii_error(const std::string& msg)
            : std::logic_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_INVALID_CHARACTER(...) \
        throw ::pngchunk::invalid_character(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_TOO_LONG_IF(condition, ...) \
        do { if (condition) throw ::pngchunk::too_long(::pngchunk::build_error_msg(__VA_ARGS__)); } while(0)

    #define THROW_VALIDATION(...) \
        throw ::pngchunk::validation_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_ASCII_UNLESS(condition, ...) \
        do { if (!(condition)) throw ::pngchunk::ascii_error(::pngchunk::build_error_msg(__VA_ARGS__)); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
