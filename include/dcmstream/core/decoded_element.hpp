/**
 * @file decoded_element.hpp
 * @brief A data element produced by the eager element stream
 */

#pragma once

#include "dcmstream/core/dicom_value.hpp"
#include "dcmstream/core/element_header.hpp"

namespace dcmstream::core {

/**
 * @brief Header plus materialized value
 *
 * Sequence elements and structural boundaries (items, delimiters) carry
 * the empty value; their contents follow as separate elements.
 */
struct decoded_element {
    element_header header;
    dicom_value value;

    [[nodiscard]] auto tag() const noexcept -> dicom_tag { return header.tag; }

    [[nodiscard]] auto vr() const noexcept -> encoding::vr_type { return header.vr; }

    [[nodiscard]] auto length() const noexcept -> uint32_t { return header.length; }

    [[nodiscard]] auto operator==(const decoded_element& other) const -> bool = default;
};

}  // namespace dcmstream::core
