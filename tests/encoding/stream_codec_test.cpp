/**
 * @file stream_codec_test.cpp
 * @brief Unit tests for header and value decoding in all uncompressed encodings
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmstream/core/dicom_tag_constants.hpp>
#include <dcmstream/encoding/stream_codec.hpp>
#include <dcmstream/io/memory_source.hpp>

#include "test_stream_builder.hpp"

using namespace dcmstream;
using namespace dcmstream::core;
using namespace dcmstream::encoding;
using dcmstream::test::stream_builder;

namespace {

auto make(const transfer_syntax& ts,
          specific_character_set cs = specific_character_set{}) -> std::unique_ptr<element_codec> {
    auto codec = make_codec(ts, cs);
    REQUIRE(codec.is_ok());
    return std::move(codec.value());
}

}  // namespace

// ============================================================================
// Factory Tests
// ============================================================================

TEST_CASE("make_codec rejects syntaxes that cannot be walked", "[encoding][codec]") {
    SECTION("unknown UID") {
        auto codec = make_codec(transfer_syntax{"1.2.3"}, specific_character_set{});
        REQUIRE(codec.is_err());
        CHECK(codec.error().code == error_codes::unsupported_transfer_syntax);
    }

    SECTION("deflate") {
        auto codec = make_codec(transfer_syntax::deflated_explicit_vr_little_endian,
                                specific_character_set{});
        REQUIRE(codec.is_err());
        CHECK(codec.error().code == error_codes::unsupported_transfer_syntax);
    }

    SECTION("encapsulated syntax uses explicit VR little endian rules") {
        auto codec = make(transfer_syntax{"1.2.840.10008.1.2.4.50"});
        CHECK(codec->syntax().is_encapsulated());
    }
}

// ============================================================================
// Header Decoding Tests
// ============================================================================

TEST_CASE("stream_codec explicit VR little endian headers", "[encoding][codec][explicit]") {
    auto codec = make(transfer_syntax::explicit_vr_little_endian);

    SECTION("16-bit length") {
        io::memory_source source(
            stream_builder::explicit_le().text(tags::patient_name, vr_type::PN, "DOE^JOHN").take());

        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());
        CHECK(header.value() == element_header{tags::patient_name, vr_type::PN, 8});
        CHECK(source.position().value() == 8);
    }

    SECTION("32-bit length with reserved bytes") {
        io::memory_source source(stream_builder::explicit_le()
                                     .element(tags::pixel_data, vr_type::OB, {1, 2, 3, 4})
                                     .take());

        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());
        CHECK(header.value() == element_header{tags::pixel_data, vr_type::OB, 4});
        CHECK(source.position().value() == 12);
    }

    SECTION("item tags carry no VR") {
        io::memory_source source(stream_builder::explicit_le().item(16).take());

        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());
        CHECK(header.value() == element_header{tags::item, vr_type::UN, 16});
    }

    SECTION("unknown VR") {
        io::memory_source source(std::vector<uint8_t>{0x10, 0x00, 0x10, 0x00, 'Z', 'Z', 0, 0});

        auto header = codec->decode_header(source);
        REQUIRE(header.is_err());
        CHECK(header.error().code == error_codes::unknown_vr);
    }

    SECTION("truncated header") {
        io::memory_source source(std::vector<uint8_t>{0x10, 0x00, 0x10});

        auto header = codec->decode_header(source);
        REQUIRE(header.is_err());
        CHECK(header.error().code == error_codes::insufficient_data);
    }
}

TEST_CASE("stream_codec implicit VR uses the dictionary", "[encoding][codec][implicit]") {
    auto codec = make(transfer_syntax::implicit_vr_little_endian);

    io::memory_source source(stream_builder::implicit_le()
                                 .us(tags::rows, {512})
                                 .text(dicom_tag{0x0029, 0x1010}, vr_type::UN, "ab")
                                 .sequence(tags::referenced_image_sequence)
                                 .take());

    auto rows = codec->decode_header(source);
    REQUIRE(rows.is_ok());
    CHECK(rows.value() == element_header{tags::rows, vr_type::US, 2});
    auto value = codec->read_value(source, rows.value());
    REQUIRE(value.is_ok());
    CHECK(value.value().as_numeric<uint16_t>().value() == 512);

    auto priv = codec->decode_header(source);
    REQUIRE(priv.is_ok());
    CHECK(priv.value().vr == vr_type::UN);
    REQUIRE(source.skip(priv.value().length).is_ok());

    auto seq = codec->decode_header(source);
    REQUIRE(seq.is_ok());
    CHECK(seq.value().vr == vr_type::SQ);
    CHECK(seq.value().has_undefined_length());
}

TEST_CASE("stream_codec big endian decodes the same logical header",
          "[encoding][codec][big_endian]") {
    auto le_codec = make(transfer_syntax::explicit_vr_little_endian);
    auto be_codec = make(transfer_syntax::explicit_vr_big_endian);

    io::memory_source le(stream_builder::explicit_le().us(tags::columns, {256, 1}).take());
    io::memory_source be(stream_builder::explicit_be().us(tags::columns, {256, 1}).take());

    auto le_header = le_codec->decode_header(le);
    auto be_header = be_codec->decode_header(be);
    REQUIRE(le_header.is_ok());
    REQUIRE(be_header.is_ok());
    CHECK(le_header.value() == be_header.value());

    auto le_value = le_codec->read_value(le, le_header.value());
    auto be_value = be_codec->read_value(be, be_header.value());
    REQUIRE(le_value.is_ok());
    REQUIRE(be_value.is_ok());
    CHECK(be_value.value().as_numbers<uint16_t>().value() == std::vector<uint16_t>{256, 1});
    CHECK(le_value.value() == be_value.value());
}

// ============================================================================
// Item Header Tests
// ============================================================================

TEST_CASE("stream_codec item headers", "[encoding][codec][sequence]") {
    auto codec = make(transfer_syntax::explicit_vr_little_endian);

    SECTION("item, item delimiter and sequence delimiter") {
        io::memory_source source(stream_builder::explicit_le()
                                     .item()
                                     .item_delimiter()
                                     .sequence_delimiter()
                                     .take());

        auto item = codec->decode_item_header(source);
        REQUIRE(item.is_ok());
        CHECK(item.value() == item_header::item(undefined_length));

        auto item_delim = codec->decode_item_header(source);
        REQUIRE(item_delim.is_ok());
        CHECK(item_delim.value().is_item_delimiter());

        auto seq_delim = codec->decode_item_header(source);
        REQUIRE(seq_delim.is_ok());
        CHECK(seq_delim.value().is_sequence_delimiter());
    }

    SECTION("regular element where an item is expected") {
        io::memory_source source(
            stream_builder::explicit_le().text(tags::modality, vr_type::CS, "CT").take());

        auto item = codec->decode_item_header(source);
        REQUIRE(item.is_err());
        CHECK(item.error().code == error_codes::invalid_sequence);
    }

    SECTION("delimiter with non-zero length") {
        io::memory_source source(std::vector<uint8_t>{0xFE, 0xFF, 0xDD, 0xE0, 4, 0, 0, 0});

        auto delim = codec->decode_item_header(source);
        REQUIRE(delim.is_err());
        CHECK(delim.error().code == error_codes::invalid_length_encoding);
    }
}

// ============================================================================
// Value Decoding Tests
// ============================================================================

TEST_CASE("stream_codec text values", "[encoding][codec][value]") {
    auto codec = make(transfer_syntax::explicit_vr_little_endian);

    SECTION("multi-valued text is split and unpadded") {
        io::memory_source source(stream_builder::explicit_le()
                                     .text(dicom_tag{0x0008, 0x0008}, vr_type::CS,
                                           "ORIGINAL\\PRIMARY")
                                     .take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().as_strings().value() ==
              std::vector<std::string>{"ORIGINAL", "PRIMARY"});
    }

    SECTION("UI drops NUL padding") {
        io::memory_source source(
            stream_builder::explicit_le().text(tags::sop_class_uid, vr_type::UI, "1.2.3").take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());
        CHECK(header.value().length == 6);

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().as_string().value() == "1.2.3");
    }

    SECTION("LT keeps backslashes") {
        io::memory_source source(stream_builder::explicit_le()
                                     .text(dicom_tag{0x0020, 0x4000}, vr_type::LT, "a\\b")
                                     .take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().multiplicity() == 1);
        CHECK(value.value().as_string().value() == "a\\b");
    }

    SECTION("character set applies to person names") {
        codec->set_character_set(
            specific_character_set{specific_character_set::repertoire::latin1});
        io::memory_source source(stream_builder::explicit_le()
                                     .element(tags::patient_name, vr_type::PN,
                                              {'M', 0xFC, 'L', 'L', 'E', 'R'})
                                     .take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().as_string().value() == "M\xC3\xBCLLER");
    }

    SECTION("zero length yields the empty value") {
        io::memory_source source(
            stream_builder::explicit_le().header(tags::patient_name, vr_type::PN, 0).take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().is_empty());
    }
}

TEST_CASE("stream_codec binary values", "[encoding][codec][value]") {
    SECTION("numeric length mismatch") {
        auto codec = make(transfer_syntax::explicit_vr_little_endian);
        io::memory_source source(
            stream_builder::explicit_le().element(tags::rows, vr_type::US, {1, 2, 3}).take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_err());
        CHECK(value.error().code == error_codes::data_size_mismatch);
    }

    SECTION("attribute tags") {
        auto codec = make(transfer_syntax::explicit_vr_big_endian);
        io::memory_source source(stream_builder::explicit_be()
                                     .element(dicom_tag{0x0020, 0x9165}, vr_type::AT,
                                              {0x00, 0x28, 0x00, 0x10})
                                     .take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        CHECK(value.value().as_tags().value() == std::vector<dicom_tag>{tags::rows});
    }

    SECTION("OW words are returned in little endian order") {
        auto codec = make(transfer_syntax::explicit_vr_big_endian);
        io::memory_source source(stream_builder::explicit_be()
                                     .element(tags::pixel_data, vr_type::OW, {0x12, 0x34})
                                     .take());
        auto header = codec->decode_header(source);
        REQUIRE(header.is_ok());

        auto value = codec->read_value(source, header.value());
        REQUIRE(value.is_ok());
        const auto bytes = value.value().raw_bytes();
        REQUIRE(bytes.size() == 2);
        CHECK(bytes[0] == 0x34);
        CHECK(bytes[1] == 0x12);
    }

    SECTION("undefined length cannot be read") {
        auto codec = make(transfer_syntax::explicit_vr_little_endian);
        io::memory_source source(std::vector<uint8_t>{});

        auto value = codec->read_value(
            source, element_header{tags::pixel_data, vr_type::OB, undefined_length});
        REQUIRE(value.is_err());
        CHECK(value.error().code == error_codes::invalid_length_encoding);
    }

    SECTION("value past the end of data") {
        auto codec = make(transfer_syntax::explicit_vr_little_endian);
        io::memory_source source(std::vector<uint8_t>{0x01});

        auto value =
            codec->read_value(source, element_header{tags::rows, vr_type::US, 2});
        REQUIRE(value.is_err());
        CHECK(value.error().code == error_codes::insufficient_data);
    }
}
