/**
 * @file chunk_types.hh
 * @brief Chunk types defined by the PNG specification
 */

#pragma once

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    namespace chunk_id {
        // Critical chunks
        inline constexpr chunk_type IHDR = "IHDR"_chunk;
        inline constexpr chunk_type PLTE = "PLTE"_chunk;
        inline constexpr chunk_type IDAT = "IDAT"_chunk;
        inline constexpr chunk_type IEND = "IEND"_chunk;

        // Colour space information
        inline constexpr chunk_type cHRM = "cHRM"_chunk;
        inline constexpr chunk_type gAMA = "gAMA"_chunk;
        inline constexpr chunk_type iCCP = "iCCP"_chunk;
        inline constexpr chunk_type sBIT = "sBIT"_chunk;
        inline constexpr chunk_type sRGB = "sRGB"_chunk;

        // Miscellaneous information
        inline constexpr chunk_type bKGD = "bKGD"_chunk;
        inline constexpr chunk_type hIST = "hIST"_chunk;
        inline constexpr chunk_type tRNS = "tRNS"_chunk;
        inline constexpr chunk_type pHYs = "pHYs"_chunk;
        inline constexpr chunk_type sPLT = "sPLT"_chunk;
        inline constexpr chunk_type tIME = "tIME"_chunk;

        // Textual information
        inline constexpr chunk_type iTXt = "iTXt"_chunk;
        inline constexpr chunk_type tEXt = "tEXt"_chunk;
        inline constexpr chunk_type zTXt = "zTXt"_chunk;
    }

    /**
     * @brief Check if a chunk type is one of the chunk_id constants
     * @param t Chunk type to look up
     * @return True for the 18 chunk types of the PNG specification
     */
    PNGCHUNK_EXPORT bool is_standard(const chunk_type& t);

} // namespace pngchunk
