/**
 * @file special_attributes.cpp
 * @brief Special attribute registry and the character set handler
 */

#include "dcmstream/parser/special_attributes.hpp"

#include <dcmstream/core/dicom_tag_constants.hpp>
#include <dcmstream/integration/logger_adapter.hpp>

#include <string>

namespace dcmstream::parser {

using integration::logger_adapter;

auto special_attribute_registry::with_defaults() -> special_attribute_registry {
    special_attribute_registry registry;
    registry.register_handler(core::tags::specific_character_set,
                              &apply_specific_character_set);
    return registry;
}

void special_attribute_registry::register_handler(core::dicom_tag tag,
                                                  special_attribute_handler handler) {
    handlers_.insert_or_assign(tag, std::move(handler));
}

auto special_attribute_registry::remove_handler(core::dicom_tag tag) -> bool {
    return handlers_.erase(tag) > 0;
}

auto special_attribute_registry::contains(core::dicom_tag tag) const -> bool {
    return handlers_.find(tag) != handlers_.end();
}

auto special_attribute_registry::invoke(const core::element_header& header,
                                        const core::dicom_value& value,
                                        encoding::element_codec& codec) const -> VoidResult {
    const auto it = handlers_.find(header.tag);
    if (it == handlers_.end() || !it->second) {
        return ok();
    }
    return it->second(header, value, codec);
}

auto apply_specific_character_set([[maybe_unused]] const core::element_header& header,
                                  const core::dicom_value& value,
                                  encoding::element_codec& codec) -> VoidResult {
    std::string term;
    if (!value.is_empty()) {
        auto text = value.as_string();
        if (text.is_err()) {
            return VoidResult(text.error());
        }
        term = text.value();
    }

    auto charset = encoding::specific_character_set::from_term(term);
    if (charset.is_err()) {
        logger_adapter::warn("Ignoring Specific Character Set '{}': {}", term,
                             charset.error().message);
        return ok();
    }

    if (charset.value() != codec.character_set()) {
        logger_adapter::info("Specific Character Set changed from '{}' to '{}'",
                             codec.character_set().term(), charset.value().term());
        codec.set_character_set(charset.value());
    }
    return ok();
}

}  // namespace dcmstream::parser
