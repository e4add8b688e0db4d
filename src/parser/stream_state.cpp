/**
 * @file stream_state.cpp
 * @brief Frame stack transitions
 */

#include "dcmstream/parser/stream_state.hpp"

#include <dcmstream/compat/format.hpp>
#include <dcmstream/core/dicom_tag_constants.hpp>

namespace dcmstream::parser {

auto stream_state::enter_sequence(core::dicom_tag tag, std::optional<uint64_t> end_offset,
                                  bool encapsulated, bool implicit_vr) -> VoidResult {
    if (is_awaiting_item()) {
        return make_stream_void_error(
            error_codes::invalid_sequence,
            compat::format("Sequence {} opened where an item boundary is expected",
                           tag.to_string()));
    }
    if (depth_ >= max_depth_) {
        return make_stream_void_error(
            error_codes::nesting_too_deep,
            compat::format("Sequence {} exceeds maximum nesting depth {}", tag.to_string(),
                           max_depth_));
    }
    const bool inherited = in_implicit_vr();
    frames_.push_back(
        frame{frame_kind::sequence, tag, end_offset, encapsulated, implicit_vr || inherited, {}});
    ++depth_;
    return ok();
}

auto stream_state::enter_item(std::optional<uint64_t> end_offset,
                              encoding::specific_character_set charset) -> VoidResult {
    if (!is_awaiting_item()) {
        return make_stream_void_error(error_codes::invalid_sequence,
                                      "Item found outside of a sequence");
    }
    if (frames_.back().encapsulated) {
        return make_stream_void_error(error_codes::invalid_sequence,
                                      "Pixel data fragments cannot hold nested elements");
    }
    const bool implicit_vr = frames_.back().implicit_vr;
    frames_.push_back(
        frame{frame_kind::item, core::tags::item, end_offset, false, implicit_vr, charset});
    return ok();
}

auto stream_state::leave_item() -> Result<frame> {
    if (!in_item()) {
        return make_stream_error<frame>(error_codes::invalid_sequence,
                                        "Item delimiter found outside of an item");
    }
    auto closed = frames_.back();
    pop();
    return Result<frame>::ok(closed);
}

auto stream_state::leave_sequence() -> Result<frame> {
    if (!is_awaiting_item()) {
        return make_stream_error<frame>(
            error_codes::invalid_sequence,
            depth_ == 0 ? std::string{"Sequence delimiter found at depth 0"}
                        : std::string{"Sequence delimiter found inside an open item"});
    }
    auto closed = frames_.back();
    pop();
    return Result<frame>::ok(closed);
}

auto stream_state::pop_completed(uint64_t position) -> Result<std::optional<frame>> {
    if (frames_.empty() || !frames_.back().end_offset) {
        return Result<std::optional<frame>>::ok(std::nullopt);
    }
    const auto end = *frames_.back().end_offset;
    if (position < end) {
        return Result<std::optional<frame>>::ok(std::nullopt);
    }
    if (position > end) {
        return make_stream_error<std::optional<frame>>(
            error_codes::invalid_sequence,
            compat::format("Element overruns the end of its enclosing {} at offset {} "
                           "(now at {})",
                           frames_.back().is_sequence() ? "sequence" : "item", end, position));
    }
    auto closed = frames_.back();
    pop();
    return Result<std::optional<frame>>::ok(std::optional<frame>{closed});
}

void stream_state::pop() noexcept {
    if (frames_.back().is_sequence()) {
        --depth_;
    }
    frames_.pop_back();
}

}  // namespace dcmstream::parser
