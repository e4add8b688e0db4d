/**
 * @file transfer_syntax_test.cpp
 * @brief Unit tests for the transfer syntax registry
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmstream/encoding/transfer_syntax.hpp>

#include <string>

using namespace dcmstream::encoding;

TEST_CASE("transfer_syntax well-known instances", "[encoding][transfer_syntax]") {
    SECTION("Implicit VR Little Endian") {
        const auto& ts = transfer_syntax::implicit_vr_little_endian;
        CHECK(ts.uid() == "1.2.840.10008.1.2");
        CHECK(ts.vr_type() == vr_encoding::implicit);
        CHECK(ts.endianness() == byte_order::little_endian);
        CHECK(ts.is_supported());
    }

    SECTION("Explicit VR Big Endian") {
        const auto& ts = transfer_syntax::explicit_vr_big_endian;
        CHECK(ts.vr_type() == vr_encoding::explicit_vr);
        CHECK(ts.endianness() == byte_order::big_endian);
        CHECK_FALSE(ts.is_encapsulated());
    }

    SECTION("Deflated is known but cannot be walked") {
        const auto& ts = transfer_syntax::deflated_explicit_vr_little_endian;
        CHECK(ts.is_valid());
        CHECK(ts.is_deflated());
        CHECK_FALSE(ts.is_supported());
    }
}

TEST_CASE("transfer_syntax lookup by UID", "[encoding][transfer_syntax]") {
    SECTION("encapsulated syntaxes") {
        for (const auto* uid : {"1.2.840.10008.1.2.4.50", "1.2.840.10008.1.2.4.70",
                                "1.2.840.10008.1.2.4.90", "1.2.840.10008.1.2.5"}) {
            const transfer_syntax ts{uid};
            CHECK(ts.is_valid());
            CHECK(ts.is_encapsulated());
            CHECK(ts.vr_type() == vr_encoding::explicit_vr);
            CHECK(ts.is_supported());
        }
    }

    SECTION("UI padding is ignored") {
        const transfer_syntax ts{std::string("1.2.840.10008.1.2.1") + '\0'};
        CHECK(ts.is_valid());
        CHECK(ts == transfer_syntax::explicit_vr_little_endian);
    }

    SECTION("unknown UID") {
        const transfer_syntax ts{"1.2.3.4"};
        CHECK_FALSE(ts.is_valid());
        CHECK_FALSE(ts.is_supported());
        CHECK_FALSE(find_transfer_syntax("1.2.3.4").has_value());
    }

    SECTION("find_transfer_syntax") {
        auto ts = find_transfer_syntax("1.2.840.10008.1.2.2");
        REQUIRE(ts.has_value());
        CHECK(ts->name() == "Explicit VR Big Endian");
    }
}

TEST_CASE("supported_transfer_syntaxes excludes deflate", "[encoding][transfer_syntax]") {
    const auto all = supported_transfer_syntaxes();

    CHECK(all.size() == 10);
    for (const auto& ts : all) {
        CHECK_FALSE(ts.is_deflated());
    }
}
