/**
 * @file element_stream.cpp
 * @brief Stepping logic of the element streams
 */

#include "dcmstream/parser/element_stream.hpp"

#include <dcmstream/compat/format.hpp>
#include <dcmstream/core/dicom_tag_constants.hpp>
#include <dcmstream/encoding/transfer_syntax.hpp>
#include <dcmstream/integration/logger_adapter.hpp>

namespace dcmstream::parser {

using integration::logger_adapter;

namespace {

auto end_of(const core::element_header& header, uint64_t position) -> std::optional<uint64_t> {
    if (header.has_undefined_length()) {
        return std::nullopt;
    }
    return position + header.length;
}

/// Read a value, refusing anything beyond the configured size limit.
auto read_limited_value(io::byte_source& source, encoding::element_codec& codec,
                        const core::element_header& header, const stream_options& options)
    -> Result<core::dicom_value> {
    if (header.length > options.max_value_length) {
        return make_stream_error<core::dicom_value>(
            error_codes::value_too_large,
            compat::format("Value of {} is {} bytes, limit is {}", header.tag.to_string(),
                           header.length, options.max_value_length));
    }
    return codec.read_value(source, header);
}

/// Undefined-length UN: the value is a sequence in Implicit VR Little Endian.
auto has_implicit_contents(const core::element_header& header) -> bool {
    return header.vr == encoding::vr_type::UN && header.has_undefined_length();
}

}  // namespace

// =============================================================================
// Strategies
// =============================================================================

auto eager_strategy::make_item(const core::element_header& header,
                               [[maybe_unused]] uint64_t position, core::dicom_value value)
    -> item_type {
    return core::decoded_element{header, std::move(value)};
}

auto eager_strategy::take_value(source_type& source, encoding::element_codec& codec,
                                const core::element_header& header,
                                [[maybe_unused]] uint64_t position,
                                const stream_options& options) -> Result<item_type> {
    auto value = read_limited_value(source, codec, header, options);
    if (value.is_err()) {
        return forward_error<item_type>(value);
    }
    return Result<item_type>::ok(core::decoded_element{header, std::move(value.value())});
}

auto lazy_strategy::make_item(const core::element_header& header, uint64_t position,
                              [[maybe_unused]] core::dicom_value value) -> item_type {
    return element_marker{header, position};
}

auto lazy_strategy::take_value(source_type& source,
                               [[maybe_unused]] encoding::element_codec& codec,
                               const core::element_header& header, uint64_t position,
                               [[maybe_unused]] const stream_options& options)
    -> Result<item_type> {
    if (header.has_undefined_length()) {
        return make_stream_error<item_type>(
            error_codes::invalid_length_encoding,
            compat::format("Cannot skip value of undefined length for {}",
                           header.tag.to_string()));
    }
    auto skipped = source.skip(header.length);
    if (skipped.is_err()) {
        return forward_error<item_type>(skipped);
    }
    return Result<item_type>::ok(element_marker{header, position});
}

// =============================================================================
// Construction
// =============================================================================

template <typename Strategy>
basic_element_stream<Strategy>::basic_element_stream(
    source_type& source, std::unique_ptr<encoding::element_codec> codec,
    std::unique_ptr<encoding::element_codec> implicit_codec, stream_options options)
    : source_(&source),
      codec_(std::move(codec)),
      implicit_codec_(std::move(implicit_codec)),
      options_(std::move(options)),
      handlers_(options_.register_default_handlers
                    ? special_attribute_registry::with_defaults()
                    : special_attribute_registry{}),
      state_(options_.max_depth) {}

template <typename Strategy>
auto basic_element_stream<Strategy>::create(source_type& source, stream_options options)
    -> Result<basic_element_stream> {
    auto charset = encoding::specific_character_set::from_term(options.character_set);
    if (charset.is_err()) {
        return forward_error<basic_element_stream>(charset);
    }

    auto codec = encoding::make_codec(encoding::transfer_syntax{options.transfer_syntax_uid},
                                      charset.value());
    if (codec.is_err()) {
        return forward_error<basic_element_stream>(codec);
    }

    // Undefined-length UN values are always Implicit VR Little Endian
    auto implicit_codec = encoding::make_codec(
        encoding::transfer_syntax::implicit_vr_little_endian, charset.value());
    if (implicit_codec.is_err()) {
        return forward_error<basic_element_stream>(implicit_codec);
    }

    return Result<basic_element_stream>::ok(
        basic_element_stream(source, std::move(codec.value()),
                             std::move(implicit_codec.value()), std::move(options)));
}

// =============================================================================
// Stepping
// =============================================================================

template <typename Strategy>
auto basic_element_stream<Strategy>::next() -> std::optional<Result<item_type>> {
    if (is_exhausted()) {
        return std::nullopt;
    }

    auto result = step();
    if (result.is_err()) {
        state_.set_terminal();
        finished_ = true;
        const auto& err = result.error();
        logger_adapter::warn("{} element stream stopped after {} items at depth {}: {} ({})",
                             Strategy::name, items_read_, state_.depth(), err.message,
                             err.code);
        return Result<item_type>::err(err);
    }

    if (!result.value().has_value()) {
        finished_ = true;
        return std::nullopt;
    }

    ++items_read_;
    return Result<item_type>::ok(std::move(*result.value()));
}

template <typename Strategy>
auto basic_element_stream<Strategy>::step() -> Result<std::optional<item_type>> {
    if (auto closed = close_completed_frames(); closed.is_err()) {
        return forward_error<std::optional<item_type>>(closed);
    }

    auto at_end = source_->at_end();
    if (at_end.is_err()) {
        return forward_error<std::optional<item_type>>(at_end);
    }
    if (at_end.value()) {
        if (state_.empty()) {
            return Result<std::optional<item_type>>::ok(std::nullopt);
        }
        return make_stream_error<std::optional<item_type>>(
            error_codes::insufficient_data,
            compat::format("Data ended with {} open sequence(s)", state_.depth()));
    }

    if (state_.is_awaiting_item()) {
        return step_item_boundary();
    }
    return step_element();
}

template <typename Strategy>
auto basic_element_stream<Strategy>::close_completed_frames() -> VoidResult {
    auto position = source_->position();
    if (position.is_err()) {
        return VoidResult(position.error());
    }
    while (true) {
        auto closed = state_.pop_completed(position.value());
        if (closed.is_err()) {
            return VoidResult(closed.error());
        }
        if (!closed.value()) {
            return ok();
        }
        if (!closed.value()->is_sequence()) {
            restore_character_set(*closed.value());
        }
        trace(closed.value()->is_sequence() ? "leave sequence" : "leave item",
              closed.value()->tag);
    }
}

template <typename Strategy>
auto basic_element_stream<Strategy>::step_item_boundary() -> Result<std::optional<item_type>> {
    using step_result = Result<std::optional<item_type>>;

    auto boundary = active_codec().decode_item_header(*source_);
    if (boundary.is_err()) {
        return forward_error<std::optional<item_type>>(boundary);
    }
    auto position = source_->position();
    if (position.is_err()) {
        return forward_error<std::optional<item_type>>(position);
    }

    const auto item = boundary.value();
    const auto header = item.to_element_header();

    switch (item.kind()) {
        case core::item_kind::item: {
            if (state_.in_encapsulated()) {
                if (header.has_undefined_length()) {
                    return make_stream_error<std::optional<item_type>>(
                        error_codes::invalid_sequence,
                        "Pixel data fragment with undefined length");
                }
                auto fragment = Strategy::take_value(*source_, active_codec(), header,
                                                     position.value(), options_);
                if (fragment.is_err()) {
                    return forward_error<std::optional<item_type>>(fragment);
                }
                return step_result::ok(std::optional<item_type>{std::move(fragment.value())});
            }
            if (auto entered = state_.enter_item(end_of(header, position.value()),
                                                 codec_->character_set());
                entered.is_err()) {
                return forward_error<std::optional<item_type>>(entered);
            }
            trace("enter item", header.tag);
            break;
        }
        case core::item_kind::item_delimiter:
            // Stray delimiter between items; the sequence keeps awaiting a boundary
            break;
        case core::item_kind::sequence_delimiter: {
            auto closed = state_.leave_sequence();
            if (closed.is_err()) {
                return forward_error<std::optional<item_type>>(closed);
            }
            trace(closed.value().encapsulated ? "leave encapsulated pixel data"
                                              : "leave sequence",
                  closed.value().tag);
            break;
        }
    }

    return step_result::ok(
        std::optional<item_type>{Strategy::make_item(header, position.value(), {})});
}

template <typename Strategy>
auto basic_element_stream<Strategy>::step_element() -> Result<std::optional<item_type>> {
    using step_result = Result<std::optional<item_type>>;

    auto& active = active_codec();
    auto decoded = active.decode_header(*source_);
    if (decoded.is_err()) {
        return forward_error<std::optional<item_type>>(decoded);
    }
    auto position = source_->position();
    if (position.is_err()) {
        return forward_error<std::optional<item_type>>(position);
    }
    const auto header = decoded.value();

    if (header.tag.is_structural()) {
        if (header.tag == core::tags::item_delimitation_item && state_.in_item()) {
            auto left = state_.leave_item();
            if (left.is_err()) {
                return forward_error<std::optional<item_type>>(left);
            }
            restore_character_set(left.value());
            trace("leave item", header.tag);
            return step_result::ok(
                std::optional<item_type>{Strategy::make_item(header, position.value(), {})});
        }
        return make_stream_error<std::optional<item_type>>(
            error_codes::invalid_sequence,
            compat::format("Unexpected {} where an element was expected at depth {}",
                           header.tag.to_string(), state_.depth()));
    }

    if (handlers_.contains(header.tag) && !header.has_undefined_length()) {
        auto value = read_limited_value(*source_, active, header, options_);
        if (value.is_err()) {
            return forward_error<std::optional<item_type>>(value);
        }
        if (auto handled = handlers_.invoke(header, value.value(), active); handled.is_err()) {
            return forward_error<std::optional<item_type>>(handled);
        }
        set_character_set(active.character_set());
        return step_result::ok(std::optional<item_type>{
            Strategy::make_item(header, position.value(), std::move(value.value()))});
    }

    if (header.is_encapsulated_pixel_data()) {
        if (auto entered = state_.enter_sequence(header.tag, std::nullopt, true);
            entered.is_err()) {
            return forward_error<std::optional<item_type>>(entered);
        }
        trace("enter encapsulated pixel data", header.tag);
        return step_result::ok(
            std::optional<item_type>{Strategy::make_item(header, position.value(), {})});
    }

    if (header.is_sequence()) {
        if (auto entered = state_.enter_sequence(header.tag, end_of(header, position.value()),
                                                 false, has_implicit_contents(header));
            entered.is_err()) {
            return forward_error<std::optional<item_type>>(entered);
        }
        trace(has_implicit_contents(header) ? "enter implicit VR sequence" : "enter sequence",
              header.tag);
        return step_result::ok(
            std::optional<item_type>{Strategy::make_item(header, position.value(), {})});
    }

    auto item = Strategy::take_value(*source_, active, header, position.value(), options_);
    if (item.is_err()) {
        return forward_error<std::optional<item_type>>(item);
    }
    return step_result::ok(std::optional<item_type>{std::move(item.value())});
}

template <typename Strategy>
auto basic_element_stream<Strategy>::active_codec() noexcept -> encoding::element_codec& {
    return state_.in_implicit_vr() ? *implicit_codec_ : *codec_;
}

template <typename Strategy>
void basic_element_stream<Strategy>::set_character_set(
    const encoding::specific_character_set& charset) {
    codec_->set_character_set(charset);
    implicit_codec_->set_character_set(charset);
}

template <typename Strategy>
void basic_element_stream<Strategy>::restore_character_set(const frame& item) {
    // A Specific Character Set inside an item applies to that item only
    if (codec_->character_set() == item.charset) {
        return;
    }
    logger_adapter::debug("{}: Specific Character Set restored to '{}' after item",
                          Strategy::name, item.charset.term());
    set_character_set(item.charset);
}

template <typename Strategy>
void basic_element_stream<Strategy>::trace(const char* event, core::dicom_tag tag) const {
    if (options_.trace_structure) {
        logger_adapter::debug("{}: {} {} (depth {})", Strategy::name, event, tag.to_string(),
                              state_.depth());
    }
}

// =============================================================================
// Instantiations
// =============================================================================

template class basic_element_stream<eager_strategy>;
template class basic_element_stream<lazy_strategy>;

}  // namespace dcmstream::parser
