/**
 * @file character_set_test.cpp
 * @brief Unit tests for specific_character_set
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmstream/encoding/character_set.hpp>

#include <vector>

using namespace dcmstream;
using namespace dcmstream::encoding;

TEST_CASE("specific_character_set from_term", "[encoding][charset]") {
    SECTION("default repertoire") {
        for (const auto* term : {"", "ISO_IR 6", "  "}) {
            auto cs = specific_character_set::from_term(term);
            REQUIRE(cs.is_ok());
            CHECK(cs.value().get() == specific_character_set::repertoire::default_repertoire);
        }
    }

    SECTION("Latin-1 and UTF-8") {
        auto latin1 = specific_character_set::from_term("ISO_IR 100");
        REQUIRE(latin1.is_ok());
        CHECK(latin1.value().term() == "ISO_IR 100");

        auto utf8 = specific_character_set::from_term("ISO_IR 192 ");
        REQUIRE(utf8.is_ok());
        CHECK(utf8.value().get() == specific_character_set::repertoire::utf8);
    }

    SECTION("first of several values selects the repertoire") {
        auto cs = specific_character_set::from_term("ISO_IR 100\\ISO 2022 IR 87");
        REQUIRE(cs.is_ok());
        CHECK(cs.value().get() == specific_character_set::repertoire::latin1);
    }

    SECTION("unsupported terms") {
        auto cs = specific_character_set::from_term("ISO 2022 IR 87");
        REQUIRE(cs.is_err());
        CHECK(cs.error().code == error_codes::unsupported_character_set);

        CHECK(specific_character_set::from_term("iso_ir 100").is_err());
    }
}

TEST_CASE("specific_character_set decode", "[encoding][charset]") {
    const std::vector<uint8_t> latin1_text{'M', 0xFC, 'l', 'l', 'e', 'r'};

    SECTION("ASCII passes through the default repertoire") {
        const std::vector<uint8_t> ascii{'D', 'O', 'E', '^', 'J', 'O', 'H', 'N'};
        auto text = specific_character_set{}.decode(ascii);
        REQUIRE(text.is_ok());
        CHECK(text.value() == "DOE^JOHN");
    }

    SECTION("high bytes are rejected by the default repertoire") {
        auto text = specific_character_set{}.decode(latin1_text);
        REQUIRE(text.is_err());
        CHECK(text.error().code == error_codes::decode_error);
    }

    SECTION("Latin-1 converts to UTF-8") {
        const specific_character_set cs{specific_character_set::repertoire::latin1};
        auto text = cs.decode(latin1_text);
        REQUIRE(text.is_ok());
        CHECK(text.value() == "M\xC3\xBCller");
    }

    SECTION("UTF-8 is validated") {
        const specific_character_set cs{specific_character_set::repertoire::utf8};

        const std::vector<uint8_t> valid{'M', 0xC3, 0xBC, 'l', 'l', 'e', 'r'};
        auto ok_text = cs.decode(valid);
        REQUIRE(ok_text.is_ok());
        CHECK(ok_text.value() == "M\xC3\xBCller");

        auto bad = cs.decode(latin1_text);
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == error_codes::decode_error);

        const std::vector<uint8_t> truncated{'A', 0xE2, 0x82};
        CHECK(cs.decode(truncated).is_err());
    }

    SECTION("UTF-8 boundaries of the three and four byte forms") {
        const specific_character_set cs{specific_character_set::repertoire::utf8};

        // Smallest three byte form, last code point before the surrogates,
        // largest code point
        const std::vector<uint8_t> edges{0xE0, 0xA0, 0x80, 0xED, 0x9F, 0xBF,
                                         0xF4, 0x8F, 0xBF, 0xBF};
        auto text = cs.decode(edges);
        REQUIRE(text.is_ok());
        CHECK(text.value() == "\xE0\xA0\x80\xED\x9F\xBF\xF4\x8F\xBF\xBF");

        const std::vector<std::vector<uint8_t>> invalid{
            {0xE0, 0x80, 0x80},        // overlong U+0000
            {0xE0, 0x9F, 0xBF},        // overlong U+07FF
            {0xED, 0xA0, 0x80},        // high surrogate
            {0xED, 0xBF, 0xBF},        // low surrogate
            {0xF0, 0x8F, 0xBF, 0xBF},  // overlong U+FFFF
            {0xF4, 0x90, 0x80, 0x80},  // U+110000
            {0xF5, 0x80, 0x80, 0x80},
        };
        for (const auto& bytes : invalid) {
            auto bad = cs.decode(bytes);
            REQUIRE(bad.is_err());
            CHECK(bad.error().code == error_codes::decode_error);
        }
    }
}
