/**
 * @file stream_codec.hpp
 * @brief element_codec for the uncompressed data set encodings
 *
 * One implementation covers Implicit VR Little Endian, Explicit VR Little
 * Endian and Explicit VR Big Endian. Encapsulated transfer syntaxes encode
 * their data set as Explicit VR Little Endian and use it as well.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#ifndef DCMSTREAM_ENCODING_STREAM_CODEC_HPP
#define DCMSTREAM_ENCODING_STREAM_CODEC_HPP

#include "dcmstream/encoding/element_codec.hpp"
#include "dcmstream/encoding/vr_type.hpp"

#include <cstdint>
#include <vector>

namespace dcmstream::encoding {

class stream_codec final : public element_codec {
public:
    stream_codec(transfer_syntax ts, specific_character_set charset);

    [[nodiscard]] auto decode_header(io::byte_source& source)
        -> Result<core::element_header> override;

    [[nodiscard]] auto decode_item_header(io::byte_source& source)
        -> Result<core::item_header> override;

    [[nodiscard]] auto read_value(io::byte_source& source, const core::element_header& header)
        -> Result<core::dicom_value> override;

    [[nodiscard]] auto character_set() const noexcept
        -> const specific_character_set& override {
        return charset_;
    }

    void set_character_set(specific_character_set charset) override { charset_ = charset; }

    [[nodiscard]] auto syntax() const noexcept -> const transfer_syntax& override {
        return syntax_;
    }

    [[nodiscard]] auto order() const noexcept -> byte_order { return order_; }

private:
    auto read_tag(io::byte_source& source) -> Result<core::dicom_tag>;
    auto read_u16(io::byte_source& source) -> Result<uint16_t>;
    auto read_u32(io::byte_source& source) -> Result<uint32_t>;

    auto decode_text(vr_type vr, std::vector<uint8_t> bytes) const
        -> Result<core::dicom_value>;
    auto decode_numbers(vr_type vr, const std::vector<uint8_t>& bytes) const
        -> Result<core::dicom_value>;
    auto decode_tags(const std::vector<uint8_t>& bytes) const -> Result<core::dicom_value>;
    auto decode_bytes(const vr_traits& traits, std::vector<uint8_t> bytes) const
        -> Result<core::dicom_value>;

    transfer_syntax syntax_;
    specific_character_set charset_;
    byte_order order_;
    vr_encoding vr_encoding_;
};

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_STREAM_CODEC_HPP
