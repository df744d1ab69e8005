//
// Chunk type conformance check
//

#include <pngchunk/check.hh>
#include <pngchunk/chunk_types.hh>
#include <algorithm>
#include <iomanip>
#include <string>

namespace pngchunk {
    namespace {
        class reporter {
        public:
            explicit reporter(const check_options& options)
                : options_(options) {}

            void operator()(std::size_t position, std::string_view category, const std::string& message) {
                clean_ = false;
                if (options_.strict) {
                    THROW_VALIDATION(message, " [", category, " at byte ", position, "]");
                }
                if (options_.on_warning) {
                    options_.on_warning(position, category, message);
                }
            }

            [[nodiscard]] bool clean() const { return clean_; }

        private:
            const check_options& options_;
            bool clean_ = true;
        };

        // Letters as is, anything else as \xNN
        std::string describe(const chunk_type& t) {
            std::string out;
            for (auto c : t.bytes()) {
                if (ascii::is_alpha(c)) {
                    out += static_cast<char>(c);
                } else {
                    out += build_error_msg("\\x", std::hex, std::setw(2), std::setfill('0'),
                                           static_cast<unsigned>(c));
                }
            }
            return out;
        }
    }

    bool check(const chunk_type& t, const check_options& options) {
        reporter report(options);
        const auto& b = t.bytes();

        if (!t.is_reserved_bit_valid() && ascii::is_alpha(b[2])) {
            report(2, "reserved_bit",
                   build_error_msg("chunk type '", describe(t), "' has a lowercase third letter"));
        }

        // Only reachable for tags built from raw bytes
        if (b[3] != 0 && !ascii::is_alpha(b[3])) {
            report(3, "not_letter",
                   build_error_msg("chunk type '", describe(t), "' fourth byte is not an ASCII letter"));
        }

        auto zero = std::find(b.begin(), b.end(), std::uint8_t(0));
        if (zero != b.end() && !options.allow_padding) {
            auto position = static_cast<std::size_t>(zero - b.begin());
            report(position, "padding",
                   build_error_msg("chunk type '", describe(t), "' is zero padded from byte ", position));
        }

        if (options.require_known && !is_standard(t)) {
            report(0, "unknown",
                   build_error_msg("chunk type '", describe(t), "' is not a standard PNG chunk type"));
        }

        return report.clean();
    }

} // namespace pngchunk
