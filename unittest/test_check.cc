//
// Test conformance check and its warning callback
//

#include <doctest/doctest.h>
#include <pngchunk/check.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::size_t position;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::size_t position, std::string_view category, std::string_view message) {
        warnings.push_back({position, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

namespace {
    check_options lenient(warning_tracker& tracker) {
        check_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);
        return opts;
    }
}

TEST_CASE("check - conforming chunk types") {
    SUBCASE("strict mode passes") {
        CHECK(check(chunk_type::from_string("RuSt")));
        CHECK(check(chunk_id::IHDR));
        CHECK(check(chunk_type::from_string("prVt")));
    }

    SUBCASE("no warnings in lenient mode") {
        warning_tracker tracker;
        CHECK(check(chunk_type::from_string("tEXt"), lenient(tracker)));
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("check - reserved_bit") {
    auto t = chunk_type::from_string("Rust");

    SUBCASE("strict throws") {
        CHECK_THROWS_AS(check(t), validation_error);
        CHECK_THROWS_AS(check(t), pngchunk_error);
    }

    SUBCASE("lenient reports") {
        warning_tracker tracker;
        CHECK_FALSE(check(t, lenient(tracker)));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "reserved_bit");
        CHECK(tracker.warnings[0].position == 2);
        CHECK(tracker.warnings[0].message.find("Rust") != std::string::npos);
    }
}

TEST_CASE("check - not_letter") {
    auto t = chunk_type::from_bytes({'R', 'u', 'S', '1'});
    CHECK(t.is_valid());

    warning_tracker tracker;
    CHECK_FALSE(check(t, lenient(tracker)));
    REQUIRE(tracker.warnings.size() == 1);
    CHECK(tracker.warnings[0].category == "not_letter");
    CHECK(tracker.warnings[0].position == 3);
    CHECK(tracker.warnings[0].message.find("RuS\\x31") != std::string::npos);

    CHECK_THROWS_AS(check(t), validation_error);
}

TEST_CASE("check - padding") {
    SUBCASE("short text") {
        warning_tracker tracker;
        CHECK_FALSE(check(chunk_type::from_string("RuS"), lenient(tracker)));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "padding");
        CHECK(tracker.warnings[0].position == 3);
    }

    SUBCASE("padding hides the reserved bit") {
        warning_tracker tracker;
        CHECK_FALSE(check(chunk_type::from_string("ab"), lenient(tracker)));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "padding");
        CHECK(tracker.warnings[0].position == 2);
    }

    SUBCASE("empty text") {
        warning_tracker tracker;
        CHECK_FALSE(check(chunk_type::from_string(""), lenient(tracker)));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].position == 0);
    }

    SUBCASE("zero byte from raw bytes") {
        warning_tracker tracker;
        CHECK_FALSE(check(chunk_type::from_bytes({'R', 'u', 'S', 0}), lenient(tracker)));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "padding");
        CHECK(tracker.warnings[0].position == 3);
    }

    SUBCASE("allow_padding") {
        check_options opts;
        opts.allow_padding = true;
        CHECK(check(chunk_type::from_string("RuS"), opts));
    }
}

TEST_CASE("check - unknown") {
    check_options opts;
    opts.require_known = true;

    CHECK(check(chunk_id::IDAT, opts));
    CHECK_THROWS_AS(check(chunk_type::from_string("RuSt"), opts), validation_error);

    warning_tracker tracker;
    opts.strict = false;
    opts.on_warning = std::ref(tracker);
    CHECK_FALSE(check(chunk_type::from_string("RuSt"), opts));
    CHECK(tracker.has_warning("unknown"));
}

TEST_CASE("check - several findings") {
    check_options opts;
    opts.strict = false;
    opts.require_known = true;
    warning_tracker tracker;
    opts.on_warning = std::ref(tracker);

    CHECK_FALSE(check(chunk_type::from_bytes({'r', 'u', 's', 0}), opts));
    CHECK(tracker.warnings.size() == 3);
    CHECK(tracker.has_warning("reserved_bit"));
    CHECK(tracker.has_warning("padding"));
    CHECK(tracker.has_warning("unknown"));
    CHECK_FALSE(tracker.has_warning("not_letter"));

    SUBCASE("strict stops at the first") {
        opts.strict = true;
        tracker.warnings.clear();
        try {
            check(chunk_type::from_bytes({'r', 'u', 's', 0}), opts);
            FAIL("Should have thrown exception");
        } catch (const validation_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("reserved_bit") != std::string::npos);
            CHECK(tracker.warnings.empty());
        }
    }
}

TEST_CASE("check - without handler") {
    check_options opts;
    opts.strict = false;
    CHECK_FALSE(check(chunk_type::from_string("Rust"), opts));
}
