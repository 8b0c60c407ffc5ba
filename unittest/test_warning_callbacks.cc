//
// Test warning callback functionality and lenient parsing
//

#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/parse_options.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngme;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

TEST_CASE("Warning callbacks - reserved_bit") {
    auto data = signature_bytes();
    append(data, make_chunk("FrSt", "I am the first chunk").as_bytes());
    append(data, make_chunk("Rust", "reserved bit set").as_bytes());   // at offset 40

    warning_tracker tracker;
    parse_options opts;
    opts.on_warning = std::ref(tracker);

    auto p = png::parse(data, opts);
    CHECK(p.chunks().size() == 2);
    REQUIRE(tracker.count_category("reserved_bit") == 1);
    CHECK(tracker.warnings[0].offset == 40);
    CHECK(tracker.warnings[0].message.find("Rust") != std::string::npos);
}

TEST_CASE("Warning callbacks - trailing_data") {
    auto data = testing_file();
    const auto file_size = data.size();
    append(data, bytes_of("garbage after the end"));

    SUBCASE("strict mode consumes the whole buffer") {
        // "garb" is read as a length, then "age " fails the type check
        CHECK_THROWS_AS((void)png::parse(data), invalid_chunk_type);
    }

    SUBCASE("lenient mode stops at IEND") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto p = png::parse(data, opts);
        CHECK(p.chunks().size() == 4);
        CHECK(p.as_bytes().size() == file_size);

        REQUIRE(tracker.has_warning("trailing_data"));
        CHECK(tracker.warnings.back().offset == file_size);
        CHECK(tracker.warnings.back().message.find("21") != std::string::npos);
    }

    SUBCASE("lenient mode without a handler") {
        parse_options opts;
        opts.strict = false;
        CHECK_NOTHROW((void)png::parse(data, opts));
    }

    SUBCASE("nothing after IEND") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        (void)png::parse(testing_file(), opts);
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("Warning callbacks - size_limit") {
    auto data = signature_bytes();
    append(data, make_chunk("biGg", std::string(100, 'x')).as_bytes());
    append(data, make_chunk("smAl", "x").as_bytes());

    parse_options opts;
    opts.max_chunk_size = 10;

    SUBCASE("strict mode fails") {
        CHECK_THROWS_AS((void)png::parse(data, opts), chunk_too_large);
    }

    SUBCASE("lenient mode warns and keeps the chunk") {
        warning_tracker tracker;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto p = png::parse(data, opts);
        CHECK(p.chunks().size() == 2);
        CHECK(p.chunks()[0].length() == 100);
        CHECK(tracker.count_category("size_limit") == 1);
        CHECK(tracker.warnings[0].offset == 8);
    }
}
