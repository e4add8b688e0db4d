/**
 * @file special_attributes.hpp
 * @brief Attributes whose value must be acted upon while walking
 */

#pragma once

#include "dcmstream/core/dicom_tag.hpp"
#include "dcmstream/core/dicom_value.hpp"
#include "dcmstream/core/element_header.hpp"
#include "dcmstream/core/result.hpp"
#include "dcmstream/encoding/element_codec.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>

namespace dcmstream::parser {

/**
 * @brief Called with the decoded value of a special attribute
 *
 * An error result is a terminal failure of the stream.
 */
using special_attribute_handler = std::function<VoidResult(
    const core::element_header& header, const core::dicom_value& value,
    encoding::element_codec& codec)>;

/**
 * @brief Tag to handler table consulted by the element streams
 *
 * The value of a registered attribute is always read, in the lazy stream
 * as well, so the handler can run before later elements are decoded.
 * Character set changes made by a handler inside a sequence item are
 * undone by the stream when that item closes.
 */
class special_attribute_registry {
public:
    /**
     * @brief Registry with the Specific Character Set handler installed
     */
    [[nodiscard]] static auto with_defaults() -> special_attribute_registry;

    /**
     * @brief Install or replace the handler of a tag
     */
    void register_handler(core::dicom_tag tag, special_attribute_handler handler);

    /**
     * @return true if a handler was removed
     */
    auto remove_handler(core::dicom_tag tag) -> bool;

    [[nodiscard]] auto contains(core::dicom_tag tag) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return handlers_.size(); }

    /**
     * @brief Run the handler registered for header.tag, if any
     */
    [[nodiscard]] auto invoke(const core::element_header& header, const core::dicom_value& value,
                              encoding::element_codec& codec) const -> VoidResult;

private:
    std::unordered_map<core::dicom_tag, special_attribute_handler> handlers_;
};

/**
 * @brief Default handler for Specific Character Set (0008,0005)
 *
 * Switches the codec to the announced character set. An unrecognized term
 * is logged and the active character set is kept.
 */
[[nodiscard]] auto apply_specific_character_set(const core::element_header& header,
                                                const core::dicom_value& value,
                                                encoding::element_codec& codec) -> VoidResult;

}  // namespace dcmstream::parser
