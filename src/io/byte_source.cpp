/**
 * @file byte_source.cpp
 * @brief Shared read/skip/seek logic of byte sources
 */

#include "dcmstream/io/byte_source.hpp"

#include <dcmstream/compat/format.hpp>

#include <algorithm>
#include <array>

namespace dcmstream::io {

namespace {

constexpr std::size_t kSkipChunk = 4096;

}  // namespace

// ============================================================================
// byte_source
// ============================================================================

auto byte_source::check_not_leased() const -> VoidResult {
    if (leased_) {
        return make_stream_void_error(error_codes::source_leased,
                                      "Source is leased by an active value window");
    }
    return ok();
}

auto byte_source::read(std::span<uint8_t> buffer) -> Result<std::size_t> {
    if (auto lease = check_not_leased(); lease.is_err()) {
        return forward_error<std::size_t>(lease);
    }
    if (buffer.empty()) {
        return Result<std::size_t>::ok(0);
    }
    return do_read(buffer);
}

auto byte_source::read_exact(std::span<uint8_t> buffer) -> VoidResult {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto result = read(buffer.subspan(filled));
        if (result.is_err()) {
            return VoidResult(result.error());
        }
        if (result.value() == 0) {
            return make_stream_void_error(
                error_codes::insufficient_data,
                compat::format("Unexpected end of data: needed {} bytes, got {}",
                               buffer.size(), filled));
        }
        filled += result.value();
    }
    return ok();
}

auto byte_source::skip(uint64_t count) -> VoidResult {
    if (auto lease = check_not_leased(); lease.is_err()) {
        return lease;
    }
    if (count == 0) {
        return ok();
    }
    return do_skip(count);
}

auto byte_source::position() const -> Result<uint64_t> {
    return do_position();
}

auto byte_source::at_end() -> Result<bool> {
    return do_at_end();
}

auto byte_source::do_skip(uint64_t count) -> VoidResult {
    std::array<uint8_t, kSkipChunk> scratch{};
    while (count > 0) {
        const auto chunk = static_cast<std::size_t>(std::min<uint64_t>(count, scratch.size()));
        auto result = do_read(std::span<uint8_t>{scratch.data(), chunk});
        if (result.is_err()) {
            return VoidResult(result.error());
        }
        if (result.value() == 0) {
            return make_stream_void_error(
                error_codes::insufficient_data,
                compat::format("Unexpected end of data while skipping {} bytes", count));
        }
        count -= result.value();
    }
    return ok();
}

// ============================================================================
// seekable_source
// ============================================================================

auto seekable_source::seek(uint64_t offset) -> VoidResult {
    if (auto lease = check_not_leased(); lease.is_err()) {
        return lease;
    }
    return do_seek(offset);
}

auto seekable_source::size() const -> Result<uint64_t> {
    return do_size();
}

auto seekable_source::do_skip(uint64_t count) -> VoidResult {
    auto pos = do_position();
    if (pos.is_err()) {
        return VoidResult(pos.error());
    }
    auto total = do_size();
    if (total.is_err()) {
        return VoidResult(total.error());
    }
    if (count > total.value() - std::min(pos.value(), total.value())) {
        return make_stream_void_error(
            error_codes::insufficient_data,
            compat::format("Cannot skip {} bytes at offset {} of {}", count, pos.value(),
                           total.value()));
    }
    return do_seek(pos.value() + count);
}

auto seekable_source::do_at_end() -> Result<bool> {
    auto pos = do_position();
    if (pos.is_err()) {
        return forward_error<bool>(pos);
    }
    auto total = do_size();
    if (total.is_err()) {
        return forward_error<bool>(total);
    }
    return Result<bool>::ok(pos.value() >= total.value());
}

}  // namespace dcmstream::io
