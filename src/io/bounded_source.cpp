/**
 * @file bounded_source.cpp
 * @brief Leased window over a seekable source
 */

#include "dcmstream/io/bounded_source.hpp"

#include <dcmstream/compat/format.hpp>

#include <algorithm>

namespace dcmstream::io {

bounded_source::bounded_source(seekable_source& parent, uint64_t start,
                               uint64_t length) noexcept
    : parent_(&parent), start_(start), length_(length) {
    parent_->leased_ = true;
}

bounded_source::~bounded_source() {
    parent_->leased_ = false;
}

auto bounded_source::create(seekable_source& parent, uint64_t start, uint64_t length)
    -> Result<std::unique_ptr<bounded_source>> {
    using result_type = Result<std::unique_ptr<bounded_source>>;

    if (parent.leased_) {
        return make_stream_error<std::unique_ptr<bounded_source>>(
            error_codes::source_leased, "Source already has an active value window");
    }

    auto total = parent.do_size();
    if (total.is_err()) {
        return forward_error<std::unique_ptr<bounded_source>>(total);
    }
    if (start > total.value() || length > total.value() - start) {
        return make_stream_error<std::unique_ptr<bounded_source>>(
            error_codes::invalid_argument,
            compat::format("Window [{}, +{}) exceeds source of {} bytes", start, length,
                           total.value()));
    }

    auto moved = parent.do_seek(start);
    if (moved.is_err()) {
        return forward_error<std::unique_ptr<bounded_source>>(moved);
    }

    return result_type::ok(
        std::unique_ptr<bounded_source>(new bounded_source(parent, start, length)));
}

auto bounded_source::read_all() -> Result<std::vector<uint8_t>> {
    std::vector<uint8_t> bytes(static_cast<std::size_t>(length_ - offset_));
    auto filled = read_exact(bytes);
    if (filled.is_err()) {
        return forward_error<std::vector<uint8_t>>(filled);
    }
    return Result<std::vector<uint8_t>>::ok(std::move(bytes));
}

auto bounded_source::do_read(std::span<uint8_t> buffer) -> Result<std::size_t> {
    const auto remaining = length_ - offset_;
    const auto count = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), remaining));
    if (count == 0) {
        return Result<std::size_t>::ok(0);
    }
    auto result = parent_->do_read(buffer.first(count));
    if (result.is_err()) {
        return result;
    }
    offset_ += result.value();
    return result;
}

auto bounded_source::do_position() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(offset_);
}

auto bounded_source::do_seek(uint64_t offset) -> VoidResult {
    if (offset > length_) {
        return make_stream_void_error(
            error_codes::seek_error,
            compat::format("Seek to {} beyond end of {}-byte window", offset, length_));
    }
    auto moved = parent_->do_seek(start_ + offset);
    if (moved.is_err()) {
        return moved;
    }
    offset_ = offset;
    return ok();
}

auto bounded_source::do_size() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(length_);
}

}  // namespace dcmstream::io
