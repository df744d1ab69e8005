/**
 * @file check_options.hh
 * @brief Options for the chunk type conformance check
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string_view>

namespace pngchunk {

    /**
     * @struct check_options
     * @brief Configuration options for check()
     *
     * Controls how strictly a chunk type is held to the PNG rules and
     * where non-fatal findings are reported.
     */
    struct check_options {
        /**
         * @brief Strict checking mode
         *
         * When true, the first finding throws validation_error.
         * When false, every finding is reported through on_warning.
         */
        bool strict = true;

        /**
         * @brief Accept zero padding
         *
         * Chunk types built from text shorter than 4 characters carry
         * trailing zero bytes. When false these are reported as "padding".
         */
        bool allow_padding = false;

        /**
         * @brief Require one of the standard PNG chunk types
         *
         * When true, chunk types not listed in chunk_id are reported
         * as "unknown".
         */
        bool require_known = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param position Byte index of the chunk type the finding refers to
         * @param category Warning category (e.g., "reserved_bit", "padding")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::size_t position,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
