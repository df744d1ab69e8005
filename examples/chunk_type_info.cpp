/**
 * @file chunk_type_info.cpp
 * @brief Prints the properties encoded in PNG chunk type names
 *
 * Each argument is parsed as a chunk type, its property bits are shown
 * and the conformance check is run on it.
 */

#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/check.hh>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {
    const char* yes_no(bool v) {
        return v ? "yes" : "no";
    }

    void print_info(const pngchunk::chunk_type& t) {
        std::cout << "Chunk type: " << t << "\n";
        std::cout << "  Critical:       " << yes_no(t.is_critical()) << "\n";
        std::cout << "  Public:         " << yes_no(t.is_public()) << "\n";
        std::cout << "  Reserved valid: " << yes_no(t.is_reserved_bit_valid()) << "\n";
        std::cout << "  Safe to copy:   " << yes_no(t.is_safe_to_copy()) << "\n";
        std::cout << "  Valid:          " << yes_no(t.is_valid()) << "\n";
        std::cout << "  Standard:       " << yes_no(pngchunk::is_standard(t)) << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::vector<std::string_view> names;
    bool lenient = false;
    for (int i = 1; i < argc; i++) {
        std::string_view arg(argv[i]);
        if (arg == "--lenient") {
            lenient = true;
        } else {
            names.push_back(arg);
        }
    }

    if (names.empty()) {
        std::cout << "Usage: " << argv[0] << " [--lenient] <chunk type>...\n";
        std::cout << "\n";
        std::cout << "Shows the property bits of each PNG chunk type.\n";
        return 1;
    }

    pngchunk::check_options options;
    options.strict = !lenient;
    options.on_warning = [](std::size_t position,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning at byte " << position
                  << " [" << category << "]: " << message << "\n";
    };

    int status = 0;
    for (auto name : names) {
        try {
            auto t = pngchunk::chunk_type::from_string(name);
            print_info(t);
            if (!pngchunk::check(t, options)) {
                status = 1;
            }
        } catch (const pngchunk::pngchunk_error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            status = 1;
        }
        std::cout << "\n";
    }

    return status;
}
