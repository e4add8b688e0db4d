/**
 * @file element_header.hpp
 * @brief Element headers and sequence item boundaries
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 * @see DICOM PS3.5 Section 7.5 - Nesting of Data Sets
 */

#pragma once

#include "dcmstream/core/dicom_tag.hpp"
#include "dcmstream/core/dicom_tag_constants.hpp"
#include "dcmstream/encoding/vr_type.hpp"

#include <cstdint>
#include <string>

namespace dcmstream::core {

/// Length value meaning "delimited by an item/sequence delimitation item"
inline constexpr uint32_t undefined_length = 0xFFFFFFFF;

/**
 * @brief The decoded header of one data element: tag, VR and value length
 */
struct element_header {
    dicom_tag tag;
    encoding::vr_type vr{encoding::vr_type::UN};
    uint32_t length{0};

    [[nodiscard]] constexpr auto has_undefined_length() const noexcept -> bool {
        return length == undefined_length;
    }

    /**
     * @brief Undefined-length pixel data: a sequence of compressed fragments
     */
    [[nodiscard]] constexpr auto is_encapsulated_pixel_data() const noexcept -> bool {
        return tag == tags::pixel_data && has_undefined_length();
    }

    /**
     * @brief The value is a nested sequence of items rather than a payload
     *
     * True for VR SQ and for undefined-length values other than encapsulated
     * pixel data. The items of an undefined-length UN value are encoded in
     * Implicit VR Little Endian whatever the transfer syntax.
     */
    [[nodiscard]] constexpr auto is_sequence() const noexcept -> bool {
        if (vr == encoding::vr_type::SQ) {
            return true;
        }
        return has_undefined_length() && !is_encapsulated_pixel_data();
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator==(const element_header& other) const noexcept
        -> bool = default;
};

/**
 * @brief Kind of a structural token between or around sequence items
 */
enum class item_kind : uint8_t {
    item,                ///< (FFFE,E000) starts an item
    item_delimiter,      ///< (FFFE,E00D) ends an undefined-length item
    sequence_delimiter,  ///< (FFFE,E0DD) ends an undefined-length sequence
};

/**
 * @brief A decoded sequence item boundary
 *
 * Boundaries are not elements and carry no value; only an item carries a
 * meaningful length (the byte count of its contents, or undefined).
 */
class item_header {
public:
    [[nodiscard]] static constexpr auto item(uint32_t length) noexcept -> item_header {
        return item_header{item_kind::item, length};
    }

    [[nodiscard]] static constexpr auto item_delimiter() noexcept -> item_header {
        return item_header{item_kind::item_delimiter, 0};
    }

    [[nodiscard]] static constexpr auto sequence_delimiter() noexcept -> item_header {
        return item_header{item_kind::sequence_delimiter, 0};
    }

    [[nodiscard]] constexpr auto kind() const noexcept -> item_kind { return kind_; }

    [[nodiscard]] constexpr auto length() const noexcept -> uint32_t { return length_; }

    [[nodiscard]] constexpr auto is_item() const noexcept -> bool {
        return kind_ == item_kind::item;
    }

    [[nodiscard]] constexpr auto is_item_delimiter() const noexcept -> bool {
        return kind_ == item_kind::item_delimiter;
    }

    [[nodiscard]] constexpr auto is_sequence_delimiter() const noexcept -> bool {
        return kind_ == item_kind::sequence_delimiter;
    }

    [[nodiscard]] constexpr auto tag() const noexcept -> dicom_tag {
        switch (kind_) {
            case item_kind::item:
                return tags::item;
            case item_kind::item_delimiter:
                return tags::item_delimitation_item;
            case item_kind::sequence_delimiter:
            default:
                return tags::sequence_delimitation_item;
        }
    }

    /**
     * @brief The boundary as a pseudo element header with VR UN
     */
    [[nodiscard]] constexpr auto to_element_header() const noexcept -> element_header {
        return element_header{tag(), encoding::vr_type::UN, length_};
    }

    [[nodiscard]] constexpr auto operator==(const item_header& other) const noexcept
        -> bool = default;

private:
    constexpr item_header(item_kind kind, uint32_t length) noexcept
        : kind_{kind}, length_{length} {}

    item_kind kind_;
    uint32_t length_;
};

}  // namespace dcmstream::core
