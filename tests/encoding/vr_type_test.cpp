/**
 * @file vr_type_test.cpp
 * @brief Unit tests for the VR table
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmstream/encoding/vr_type.hpp>

using namespace dcmstream::encoding;

TEST_CASE("vr_type string conversion", "[encoding][vr]") {
    SECTION("to_string") {
        CHECK(to_string(vr_type::PN) == "PN");
        CHECK(to_string(vr_type::SQ) == "SQ");
        CHECK(to_string(vr_type::UV) == "UV");
        CHECK(to_string(vr_type::AE) == "AE");
    }

    SECTION("from_string") {
        CHECK(from_string("OB") == vr_type::OB);
        CHECK(from_string("UI") == vr_type::UI);
        CHECK_FALSE(from_string("XX").has_value());
        CHECK_FALSE(from_string("P").has_value());
    }

    SECTION("every table entry round trips") {
        for (const auto& entry : detail::kVrTable) {
            const auto name = to_string(entry.vr);
            REQUIRE(name.size() == 2);
            CHECK(vr_from_chars(name[0], name[1]) == entry.vr);
        }
    }
}

TEST_CASE("vr_type categories", "[encoding][vr]") {
    CHECK(is_string_vr(vr_type::LO));
    CHECK(is_string_vr(vr_type::UI));
    CHECK_FALSE(is_string_vr(vr_type::US));

    CHECK(is_numeric_vr(vr_type::US));
    CHECK(is_numeric_vr(vr_type::FD));
    CHECK_FALSE(is_numeric_vr(vr_type::OW));

    CHECK(is_binary_vr(vr_type::OB));
    CHECK(is_binary_vr(vr_type::UN));
    CHECK_FALSE(is_binary_vr(vr_type::SQ));
}

TEST_CASE("vr_type explicit length field size", "[encoding][vr]") {
    SECTION("32-bit length VRs") {
        for (const auto vr : {vr_type::OB, vr_type::OD, vr_type::OF, vr_type::OL, vr_type::OV,
                              vr_type::OW, vr_type::SQ, vr_type::SV, vr_type::UC, vr_type::UN,
                              vr_type::UR, vr_type::UT, vr_type::UV}) {
            CHECK(has_explicit_32bit_length(vr));
        }
    }

    SECTION("16-bit length VRs") {
        for (const auto vr : {vr_type::AE, vr_type::CS, vr_type::DS, vr_type::LO, vr_type::PN,
                              vr_type::SH, vr_type::UI, vr_type::UL, vr_type::US, vr_type::AT}) {
            CHECK_FALSE(has_explicit_32bit_length(vr));
        }
    }
}

TEST_CASE("vr_type multi-valued text", "[encoding][vr]") {
    CHECK(traits_of(vr_type::CS)->multi_valued_text);
    CHECK(traits_of(vr_type::UC)->multi_valued_text);
    CHECK_FALSE(traits_of(vr_type::LT)->multi_valued_text);
    CHECK_FALSE(traits_of(vr_type::UT)->multi_valued_text);
    CHECK_FALSE(traits_of(static_cast<vr_type>(0x5858)).has_value());
}
