#include <doctest/doctest.h>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <array>
#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngme;

namespace {
    std::array<std::byte, 4> raw(char c0, char c1, char c2, char c3) {
        return {std::byte(c0), std::byte(c1), std::byte(c2), std::byte(c3)};
    }
}

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk type construction") {
        SUBCASE("from bytes") {
            auto expected = raw(82, 117, 83, 116);
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
            CHECK(actual.to_string() == "RuSt");
        }

        SUBCASE("from raw pointer") {
            unsigned char bytes[4] = {'I', 'H', 'D', 'R'};
            auto t = chunk_type::from_bytes(bytes);
            CHECK(t.to_string() == "IHDR");
        }

        SUBCASE("from string") {
            auto expected = chunk_type::from_bytes(raw(82, 117, 83, 116));
            auto actual = chunk_type::from_string("RuSt");
            CHECK(expected == actual);
        }

        SUBCASE("case mix is accepted") {
            for (const char* text : {"abcd", "ABCD", "aBcD", "AbCd", "IEND", "tEXt"}) {
                CAPTURE(text);
                CHECK_NOTHROW((void)chunk_type::from_string(text));
            }
        }

        SUBCASE("case is preserved") {
            CHECK(chunk_type::from_string("tEXt").to_string() == "tEXt");
            CHECK(chunk_type::from_string("tEXt") != chunk_type::from_string("TEXT"));
        }
    }

    TEST_CASE("chunk type validation") {
        SUBCASE("digit") {
            CHECK_THROWS_AS((void)chunk_type::from_string("Ru1t"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_bytes(raw('R', 'u', '1', 't')), invalid_chunk_type);
        }

        SUBCASE("punctuation and space") {
            CHECK_THROWS_AS((void)chunk_type::from_string("Ru_t"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("Ru t"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("Ru!t"), invalid_chunk_type);
        }

        SUBCASE("bytes outside ASCII") {
            CHECK_THROWS_AS((void)chunk_type::from_bytes(raw('R', 'u', 'S', char(0xC1))), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_bytes(raw(0, 0, 0, 0)), invalid_chunk_type);
        }

        SUBCASE("letters next to the ASCII letter ranges") {
            // '@' '[' '`' '{' sit just outside A-Z and a-z
            CHECK_THROWS_AS((void)chunk_type::from_string("@BCD"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("ABC["), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("`bcd"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("abc{"), invalid_chunk_type);
        }

        SUBCASE("wrong length") {
            CHECK_THROWS_AS((void)chunk_type::from_string(""), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("Rus"), invalid_chunk_type);
            CHECK_THROWS_AS((void)chunk_type::from_string("RuStt"), invalid_chunk_type);
            // four characters but more than four bytes
            CHECK_THROWS_AS((void)chunk_type::from_string("R\xC3\xBCSt"), invalid_chunk_type);
        }

        SUBCASE("error kind") {
            try {
                (void)chunk_type::from_string("Ru1t");
                FAIL("Should have thrown exception");
            } catch (const pngme_error& e) {
                CHECK(e.kind() == error_kind::invalid_chunk_type);
            }
        }

        SUBCASE("try_parse") {
            CHECK(chunk_type::try_parse("RuSt").has_value());
            CHECK(chunk_type::try_parse("RuSt")->to_string() == "RuSt");
            CHECK_FALSE(chunk_type::try_parse("Ru1t").has_value());
            CHECK_FALSE(chunk_type::try_parse("RuStRuSt").has_value());
            CHECK_FALSE(chunk_type::try_parse("").has_value());
        }

        SUBCASE("try_parse agrees with from_string") {
            for (int b = 0; b < 256; ++b) {
                std::string text = "RuS";
                text.push_back(static_cast<char>(b));
                CAPTURE(b);
                auto parsed = chunk_type::try_parse(text);
                if (parsed) {
                    CHECK(chunk_type::from_string(text) == *parsed);
                } else {
                    CHECK_THROWS_AS((void)chunk_type::from_string(text), invalid_chunk_type);
                }
                CHECK(parsed.has_value() == is_chunk_type_letter(std::byte(b)));
            }
        }
    }

    TEST_CASE("chunk type properties") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("valid only looks at the reserved bit") {
            auto good = chunk_type::from_string("RuSt");
            CHECK(good.is_critical());
            CHECK_FALSE(good.is_public());
            CHECK(good.is_reserved_bit_valid());
            CHECK(good.is_safe_to_copy());
            CHECK(good.is_valid());

            CHECK_FALSE(chunk_type::from_string("Rust").is_valid());
            // ancillary, private and unsafe to copy, yet valid
            CHECK(chunk_type::from_string("abCD").is_valid());
        }

        SUBCASE("standard chunks") {
            auto ihdr = chunk_type::from_string("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::from_string("tEXt");
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk type rendering") {
        auto t = chunk_type::from_string("RuSt");
        CHECK(t.to_string() == "RuSt");

        std::ostringstream os;
        os << t;
        CHECK(os.str() == "RuSt");

        std::array<std::byte, 4> out{};
        t.to_bytes(out.data());
        CHECK(out == t.bytes());
    }

    TEST_CASE("chunk type in containers") {
        std::set<chunk_type> ordered;
        ordered.insert(chunk_type::from_string("IHDR"));
        ordered.insert(chunk_type::from_string("IDAT"));
        ordered.insert(chunk_type::from_string("IHDR"));
        CHECK(ordered.size() == 2);
        CHECK(ordered.begin()->to_string() == "IDAT");

        std::unordered_map<chunk_type, int> counts;
        counts[chunk_type::from_string("IDAT")]++;
        counts[chunk_type::from_string("IDAT")]++;
        counts[chunk_type::from_string("IEND")]++;
        CHECK(counts.size() == 2);
        CHECK(counts[chunk_type::from_string("IDAT")] == 2);
    }
}
