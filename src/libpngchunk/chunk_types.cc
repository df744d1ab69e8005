//
// Standard chunk type lookup
//

#include <pngchunk/chunk_types.hh>
#include <algorithm>
#include <array>

namespace pngchunk {
    namespace {
        using namespace chunk_id;

        constexpr std::array<chunk_type, 18> standard_types = {
            IHDR, PLTE, IDAT, IEND,
            cHRM, gAMA, iCCP, sBIT, sRGB,
            bKGD, hIST, tRNS, pHYs, sPLT, tIME,
            iTXt, tEXt, zTXt
        };
    }

    bool is_standard(const chunk_type& t) {
        return std::find(standard_types.begin(), standard_types.end(), t) != standard_types.end();
    }

} // namespace pngchunk
