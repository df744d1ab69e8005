/**
 * @file check.hh
 * @brief Conformance check for chunk types taken from a PNG stream
 */

#pragma once

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/check_options.hh>

namespace pngchunk {

    /**
     * @brief Check a chunk type against the PNG naming rules
     * @param t Chunk type to check
     * @param options Strictness and warning handling
     * @return True if no finding was made
     * @throws validation_error on the first finding in strict mode
     *
     * Findings, in the order they are examined:
     * - "reserved_bit": byte 2 is not uppercase
     * - "not_letter": byte 3 is not an ASCII letter
     * - "padding": a zero byte from short text input
     * - "unknown": not a standard chunk type (only with require_known)
     */
    PNGCHUNK_EXPORT bool check(const chunk_type& t, const check_options& options = {});

} // namespace pngchunk
