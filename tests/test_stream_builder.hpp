/**
 * @file test_stream_builder.hpp
 * @brief Builds encoded data sets byte by byte for the unit tests
 */

#pragma once

#include <dcmstream/core/dicom_tag.hpp>
#include <dcmstream/core/element_header.hpp>
#include <dcmstream/encoding/byte_order.hpp>
#include <dcmstream/encoding/vr_type.hpp>

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace dcmstream::test {

/**
 * @brief Fluent writer of element headers, values and item boundaries
 *
 * @code
 * auto bytes = stream_builder::explicit_le()
 *                  .text(tags::modality, vr_type::CS, "CT")
 *                  .sequence(tags::referenced_image_sequence)
 *                  .item()
 *                  .item_delimiter()
 *                  .sequence_delimiter()
 *                  .take();
 * @endcode
 */
class stream_builder {
public:
    stream_builder(encoding::byte_order order, bool explicit_vr)
        : order_(order), explicit_vr_(explicit_vr) {}

    static auto explicit_le() -> stream_builder {
        return stream_builder(encoding::byte_order::little_endian, true);
    }

    static auto explicit_be() -> stream_builder {
        return stream_builder(encoding::byte_order::big_endian, true);
    }

    static auto implicit_le() -> stream_builder {
        return stream_builder(encoding::byte_order::little_endian, false);
    }

    /**
     * @brief Element header only, as the current encoding writes it
     */
    auto header(core::dicom_tag tag, encoding::vr_type vr, uint32_t length) -> stream_builder& {
        put_tag(tag);
        if (!explicit_vr_) {
            put32(length);
            return *this;
        }
        const auto code = encoding::to_string(vr);
        bytes_.push_back(static_cast<uint8_t>(code[0]));
        bytes_.push_back(static_cast<uint8_t>(code[1]));
        if (encoding::has_explicit_32bit_length(vr)) {
            put16(0);
            put32(length);
        } else {
            put16(static_cast<uint16_t>(length));
        }
        return *this;
    }

    /**
     * @brief Element with raw value bytes
     */
    auto element(core::dicom_tag tag, encoding::vr_type vr, std::vector<uint8_t> value)
        -> stream_builder& {
        header(tag, vr, static_cast<uint32_t>(value.size()));
        bytes_.insert(bytes_.end(), value.begin(), value.end());
        return *this;
    }

    /**
     * @brief Text element padded to even length (NUL for UI, space otherwise)
     */
    auto text(core::dicom_tag tag, encoding::vr_type vr, std::string_view value)
        -> stream_builder& {
        std::vector<uint8_t> padded(value.begin(), value.end());
        if (padded.size() % 2 != 0) {
            padded.push_back(vr == encoding::vr_type::UI ? '\0' : ' ');
        }
        return element(tag, vr, std::move(padded));
    }

    auto us(core::dicom_tag tag, std::initializer_list<uint16_t> values) -> stream_builder& {
        header(tag, encoding::vr_type::US, static_cast<uint32_t>(values.size() * 2));
        for (const auto v : values) {
            put16(v);
        }
        return *this;
    }

    auto ul(core::dicom_tag tag, std::initializer_list<uint32_t> values) -> stream_builder& {
        header(tag, encoding::vr_type::UL, static_cast<uint32_t>(values.size() * 4));
        for (const auto v : values) {
            put32(v);
        }
        return *this;
    }

    /**
     * @brief Sequence element header (undefined length by default)
     */
    auto sequence(core::dicom_tag tag, uint32_t length = core::undefined_length)
        -> stream_builder& {
        return header(tag, encoding::vr_type::SQ, length);
    }

    auto item(uint32_t length = core::undefined_length) -> stream_builder& {
        put_tag(core::dicom_tag{0xFFFE, 0xE000});
        put32(length);
        return *this;
    }

    auto item_delimiter() -> stream_builder& {
        put_tag(core::dicom_tag{0xFFFE, 0xE00D});
        put32(0);
        return *this;
    }

    auto sequence_delimiter() -> stream_builder& {
        put_tag(core::dicom_tag{0xFFFE, 0xE0DD});
        put32(0);
        return *this;
    }

    auto raw(std::initializer_list<uint8_t> values) -> stream_builder& {
        bytes_.insert(bytes_.end(), values.begin(), values.end());
        return *this;
    }

    auto raw(const std::vector<uint8_t>& values) -> stream_builder& {
        bytes_.insert(bytes_.end(), values.begin(), values.end());
        return *this;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return bytes_.size(); }

    [[nodiscard]] auto bytes() const noexcept -> const std::vector<uint8_t>& { return bytes_; }

    [[nodiscard]] auto take() -> std::vector<uint8_t> { return std::move(bytes_); }

private:
    void put16(uint16_t value) {
        if (order_ == encoding::byte_order::little_endian) {
            bytes_.push_back(static_cast<uint8_t>(value & 0xFF));
            bytes_.push_back(static_cast<uint8_t>(value >> 8));
        } else {
            bytes_.push_back(static_cast<uint8_t>(value >> 8));
            bytes_.push_back(static_cast<uint8_t>(value & 0xFF));
        }
    }

    void put32(uint32_t value) {
        if (order_ == encoding::byte_order::little_endian) {
            put16(static_cast<uint16_t>(value & 0xFFFF));
            put16(static_cast<uint16_t>(value >> 16));
        } else {
            put16(static_cast<uint16_t>(value >> 16));
            put16(static_cast<uint16_t>(value & 0xFFFF));
        }
    }

    void put_tag(core::dicom_tag tag) {
        put16(tag.group());
        put16(tag.element());
    }

    encoding::byte_order order_;
    bool explicit_vr_;
    std::vector<uint8_t> bytes_;
};

}  // namespace dcmstream::test
