/**
 * @file vr_dictionary.hpp
 * @brief Tag to VR lookup used when the VR is not written in the stream
 *
 * Implicit VR Little Endian headers carry only a tag and a length; the VR
 * of each element has to come from the data dictionary. This dictionary
 * holds the VR of the attributes commonly found in composite objects and
 * accepts runtime registration of further (typically private) tags.
 *
 * @see DICOM PS3.6 - Data Dictionary
 * @see DICOM PS3.5 Section 7.1.3 - Data Element Structure with Implicit VR
 */

#pragma once

#include "dcmstream/core/dicom_tag.hpp"
#include "dcmstream/encoding/vr_type.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace dcmstream::core {

/**
 * @brief Process-wide tag to VR dictionary
 *
 * Thread Safety: lookups may run concurrently; registration is serialized.
 */
class vr_dictionary {
public:
    [[nodiscard]] static auto instance() -> vr_dictionary&;

    vr_dictionary(const vr_dictionary&) = delete;
    vr_dictionary(vr_dictionary&&) = delete;
    auto operator=(const vr_dictionary&) -> vr_dictionary& = delete;
    auto operator=(vr_dictionary&&) -> vr_dictionary& = delete;

    /**
     * @brief Exact dictionary entry for a tag
     */
    [[nodiscard]] auto find(dicom_tag tag) const -> std::optional<encoding::vr_type>;

    /**
     * @brief VR to assume for a tag in an implicit VR stream
     *
     * Falls back to UL for group lengths, LO for private creators, UN for
     * structural tags and anything unknown.
     */
    [[nodiscard]] auto lookup_vr(dicom_tag tag) const -> encoding::vr_type;

    /**
     * @brief Add or replace the VR of a tag
     * @return false if the tag already had an entry (which is replaced)
     */
    auto register_tag(dicom_tag tag, encoding::vr_type vr) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    vr_dictionary();

    std::unordered_map<dicom_tag, encoding::vr_type> entries_;
    mutable std::shared_mutex mutex_;
};

}  // namespace dcmstream::core
