/**
 * @file stream_codec.cpp
 * @brief Implicit/Explicit VR, little/big endian header and value decoding
 */

#include "dcmstream/encoding/stream_codec.hpp"

#include <dcmstream/compat/format.hpp>
#include <dcmstream/core/vr_dictionary.hpp>

#include <algorithm>
#include <array>

namespace dcmstream::encoding {

namespace {

// ============================================================================
// Special Tags
// ============================================================================

constexpr uint16_t ITEM_GROUP = 0xFFFE;
constexpr uint16_t ITEM_TAG_ELEMENT = 0xE000;
constexpr uint16_t ITEM_DELIM_ELEMENT = 0xE00D;
constexpr uint16_t SEQ_DELIM_ELEMENT = 0xE0DD;

// ============================================================================
// Text Helpers
// ============================================================================

/// Text VRs whose content follows Specific Character Set (0008,0005).
constexpr bool uses_character_set(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::SH:
        case vr_type::LO:
        case vr_type::ST:
        case vr_type::LT:
        case vr_type::UC:
        case vr_type::UT:
        case vr_type::PN:
            return true;
        default:
            return false;
    }
}

std::string_view strip_trailing_padding(std::string_view text, bool strip_nul) {
    while (!text.empty() && (text.back() == ' ' || (strip_nul && text.back() == '\0'))) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string> split_values(std::string_view text, bool multi_valued,
                                      bool strip_nul) {
    std::vector<std::string> values;
    if (!multi_valued) {
        values.emplace_back(strip_trailing_padding(text, strip_nul));
        return values;
    }
    std::size_t begin = 0;
    while (true) {
        const auto sep = text.find('\\', begin);
        const auto part = text.substr(begin, sep == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : sep - begin);
        values.emplace_back(strip_trailing_padding(part, strip_nul));
        if (sep == std::string_view::npos) {
            break;
        }
        begin = sep + 1;
    }
    return values;
}

template <typename T>
core::dicom_value read_numbers(const std::vector<uint8_t>& bytes, byte_order order) {
    std::vector<T> values;
    values.reserve(bytes.size() / sizeof(T));
    for (std::size_t offset = 0; offset < bytes.size(); offset += sizeof(T)) {
        values.push_back(read_value_as<T>(
            std::span<const uint8_t>{bytes.data() + offset, sizeof(T)}, order));
    }
    return core::dicom_value::from_numbers(std::move(values));
}

}  // namespace

// ============================================================================
// Factory
// ============================================================================

auto make_codec(const transfer_syntax& ts, specific_character_set charset)
    -> Result<std::unique_ptr<element_codec>> {
    if (!ts.is_valid()) {
        return make_stream_error<std::unique_ptr<element_codec>>(
            error_codes::unsupported_transfer_syntax,
            compat::format("Unknown transfer syntax: {}", ts.uid()));
    }
    if (!ts.is_supported()) {
        return make_stream_error<std::unique_ptr<element_codec>>(
            error_codes::unsupported_transfer_syntax,
            compat::format("Transfer syntax not supported for streaming: {}", ts.name()));
    }
    return Result<std::unique_ptr<element_codec>>::ok(
        std::make_unique<stream_codec>(ts, charset));
}

// ============================================================================
// Construction
// ============================================================================

stream_codec::stream_codec(transfer_syntax ts, specific_character_set charset)
    : syntax_(std::move(ts)),
      charset_(charset),
      order_(syntax_.endianness()),
      vr_encoding_(syntax_.vr_type()) {}

// ============================================================================
// Primitive Reads
// ============================================================================

auto stream_codec::read_u16(io::byte_source& source) -> Result<uint16_t> {
    std::array<uint8_t, 2> buf{};
    auto filled = source.read_exact(buf);
    if (filled.is_err()) {
        return forward_error<uint16_t>(filled);
    }
    return Result<uint16_t>::ok(read_uint<uint16_t>(buf, order_));
}

auto stream_codec::read_u32(io::byte_source& source) -> Result<uint32_t> {
    std::array<uint8_t, 4> buf{};
    auto filled = source.read_exact(buf);
    if (filled.is_err()) {
        return forward_error<uint32_t>(filled);
    }
    return Result<uint32_t>::ok(read_uint<uint32_t>(buf, order_));
}

auto stream_codec::read_tag(io::byte_source& source) -> Result<core::dicom_tag> {
    std::array<uint8_t, 4> buf{};
    auto filled = source.read_exact(buf);
    if (filled.is_err()) {
        return forward_error<core::dicom_tag>(filled);
    }
    const auto group = read_uint<uint16_t>(std::span<const uint8_t>{buf.data(), 2}, order_);
    const auto element =
        read_uint<uint16_t>(std::span<const uint8_t>{buf.data() + 2, 2}, order_);
    return Result<core::dicom_tag>::ok(core::dicom_tag{group, element});
}

// ============================================================================
// Headers
// ============================================================================

auto stream_codec::decode_header(io::byte_source& source) -> Result<core::element_header> {
    auto tag = read_tag(source);
    if (tag.is_err()) {
        return forward_error<core::element_header>(tag);
    }

    core::element_header header;
    header.tag = tag.value();

    // Items and delimiters: tag + 32-bit length, no VR in any encoding
    if (header.tag.group() == ITEM_GROUP) {
        auto length = read_u32(source);
        if (length.is_err()) {
            return forward_error<core::element_header>(length);
        }
        header.vr = vr_type::UN;
        header.length = length.value();
        return Result<core::element_header>::ok(header);
    }

    if (vr_encoding_ == vr_encoding::implicit) {
        auto length = read_u32(source);
        if (length.is_err()) {
            return forward_error<core::element_header>(length);
        }
        header.vr = core::vr_dictionary::instance().lookup_vr(header.tag);
        header.length = length.value();
        return Result<core::element_header>::ok(header);
    }

    std::array<uint8_t, 2> vr_chars{};
    if (auto filled = source.read_exact(vr_chars); filled.is_err()) {
        return forward_error<core::element_header>(filled);
    }
    const auto vr = vr_from_chars(static_cast<char>(vr_chars[0]), static_cast<char>(vr_chars[1]));
    if (!vr) {
        return make_stream_error<core::element_header>(
            error_codes::unknown_vr,
            compat::format("Unknown VR 0x{:02X}{:02X} in element {}", vr_chars[0], vr_chars[1],
                           header.tag.to_string()));
    }
    header.vr = *vr;

    if (has_explicit_32bit_length(header.vr)) {
        std::array<uint8_t, 2> reserved{};
        if (auto filled = source.read_exact(reserved); filled.is_err()) {
            return forward_error<core::element_header>(filled);
        }
        auto length = read_u32(source);
        if (length.is_err()) {
            return forward_error<core::element_header>(length);
        }
        header.length = length.value();
    } else {
        auto length = read_u16(source);
        if (length.is_err()) {
            return forward_error<core::element_header>(length);
        }
        header.length = length.value();
    }
    return Result<core::element_header>::ok(header);
}

auto stream_codec::decode_item_header(io::byte_source& source) -> Result<core::item_header> {
    auto tag = read_tag(source);
    if (tag.is_err()) {
        return forward_error<core::item_header>(tag);
    }
    auto length = read_u32(source);
    if (length.is_err()) {
        return forward_error<core::item_header>(length);
    }

    const auto t = tag.value();
    if (t.group() != ITEM_GROUP) {
        return make_stream_error<core::item_header>(
            error_codes::invalid_sequence,
            compat::format("Expected item or delimiter in sequence, found {}", t.to_string()));
    }

    switch (t.element()) {
        case ITEM_TAG_ELEMENT:
            return Result<core::item_header>::ok(core::item_header::item(length.value()));
        case ITEM_DELIM_ELEMENT:
        case SEQ_DELIM_ELEMENT:
            if (length.value() != 0) {
                return make_stream_error<core::item_header>(
                    error_codes::invalid_length_encoding,
                    compat::format("Delimiter {} has non-zero length {}", t.to_string(),
                                   length.value()));
            }
            return Result<core::item_header>::ok(t.element() == ITEM_DELIM_ELEMENT
                                                     ? core::item_header::item_delimiter()
                                                     : core::item_header::sequence_delimiter());
        default:
            return make_stream_error<core::item_header>(
                error_codes::invalid_sequence,
                compat::format("Unknown structural tag {} in sequence", t.to_string()));
    }
}

// ============================================================================
// Values
// ============================================================================

auto stream_codec::read_value(io::byte_source& source, const core::element_header& header)
    -> Result<core::dicom_value> {
    if (header.has_undefined_length()) {
        return make_stream_error<core::dicom_value>(
            error_codes::invalid_length_encoding,
            compat::format("Cannot read value of undefined length for {}",
                           header.tag.to_string()));
    }
    if (header.length == 0) {
        return Result<core::dicom_value>::ok(core::dicom_value{});
    }

    std::vector<uint8_t> bytes(header.length);
    if (auto filled = source.read_exact(bytes); filled.is_err()) {
        return forward_error<core::dicom_value>(filled);
    }

    const auto traits = traits_of(header.vr);
    if (!traits) {
        return core::dicom_value::from_bytes(std::move(bytes));
    }

    switch (traits->category) {
        case vr_category::text:
            return decode_text(header.vr, std::move(bytes));
        case vr_category::integer:
        case vr_category::floating:
            return decode_numbers(header.vr, bytes);
        case vr_category::tag:
            return decode_tags(bytes);
        case vr_category::bytes:
            return decode_bytes(*traits, std::move(bytes));
        case vr_category::sequence:
            // A defined-length sequence read as a whole stays opaque
            return core::dicom_value::from_bytes(std::move(bytes));
    }
    return core::dicom_value::from_bytes(std::move(bytes));
}

auto stream_codec::decode_text(vr_type vr, std::vector<uint8_t> bytes) const
    -> Result<core::dicom_value> {
    std::string text;
    if (uses_character_set(vr)) {
        auto decoded = charset_.decode(bytes);
        if (decoded.is_err()) {
            return forward_error<core::dicom_value>(decoded);
        }
        text = std::move(decoded.value());
    } else {
        text.assign(bytes.begin(), bytes.end());
    }

    const auto traits = traits_of(vr);
    const bool multi = traits && traits->multi_valued_text;
    return core::dicom_value::from_strings(split_values(text, multi, vr == vr_type::UI));
}

auto stream_codec::decode_numbers(vr_type vr, const std::vector<uint8_t>& bytes) const
    -> Result<core::dicom_value> {
    const auto traits = traits_of(vr);
    if (bytes.size() % traits->element_size != 0) {
        return make_stream_error<core::dicom_value>(
            error_codes::data_size_mismatch,
            compat::format("{} value length {} is not a multiple of {}", to_string(vr),
                           bytes.size(), traits->element_size));
    }

    switch (vr) {
        case vr_type::US:
            return read_numbers<uint16_t>(bytes, order_);
        case vr_type::SS:
            return read_numbers<int16_t>(bytes, order_);
        case vr_type::UL:
            return read_numbers<uint32_t>(bytes, order_);
        case vr_type::SL:
            return read_numbers<int32_t>(bytes, order_);
        case vr_type::UV:
            return read_numbers<uint64_t>(bytes, order_);
        case vr_type::SV:
            return read_numbers<int64_t>(bytes, order_);
        case vr_type::FL:
            return read_numbers<float>(bytes, order_);
        case vr_type::FD:
            return read_numbers<double>(bytes, order_);
        default:
            return make_stream_error<core::dicom_value>(
                error_codes::value_conversion_error,
                compat::format("VR {} is not numeric", to_string(vr)));
    }
}

auto stream_codec::decode_tags(const std::vector<uint8_t>& bytes) const
    -> Result<core::dicom_value> {
    if (bytes.size() % 4 != 0) {
        return make_stream_error<core::dicom_value>(
            error_codes::data_size_mismatch,
            compat::format("AT value length {} is not a multiple of 4", bytes.size()));
    }
    std::vector<core::dicom_tag> tags;
    tags.reserve(bytes.size() / 4);
    for (std::size_t offset = 0; offset < bytes.size(); offset += 4) {
        const auto group =
            read_uint<uint16_t>(std::span<const uint8_t>{bytes.data() + offset, 2}, order_);
        const auto element =
            read_uint<uint16_t>(std::span<const uint8_t>{bytes.data() + offset + 2, 2}, order_);
        tags.emplace_back(group, element);
    }
    return core::dicom_value::from_tags(std::move(tags));
}

auto stream_codec::decode_bytes(const vr_traits& traits, std::vector<uint8_t> bytes) const
    -> Result<core::dicom_value> {
    const std::size_t word = traits.element_size;
    if (word <= 1 || order_ == byte_order::little_endian) {
        return core::dicom_value::from_bytes(std::move(bytes));
    }
    if (bytes.size() % word != 0) {
        return make_stream_error<core::dicom_value>(
            error_codes::data_size_mismatch,
            compat::format("{} value length {} is not a multiple of {}", to_string(traits.vr),
                           bytes.size(), word));
    }
    // Raw words are handed out in little endian order
    for (auto it = bytes.begin(); it != bytes.end(); it += static_cast<std::ptrdiff_t>(word)) {
        std::reverse(it, it + static_cast<std::ptrdiff_t>(word));
    }
    return core::dicom_value::from_bytes(std::move(bytes));
}

}  // namespace dcmstream::encoding
