/**
 * @file memory_source.cpp
 * @brief In-memory seekable source
 */

#include "dcmstream/io/memory_source.hpp"

#include <dcmstream/compat/format.hpp>

#include <algorithm>
#include <cstring>

namespace dcmstream::io {

memory_source::memory_source(std::vector<uint8_t> bytes)
    : owned_(std::move(bytes)), data_(owned_) {}

memory_source::memory_source(std::span<const uint8_t> bytes) noexcept : data_(bytes) {}

auto memory_source::do_read(std::span<uint8_t> buffer) -> Result<std::size_t> {
    const auto available = data_.size() - std::min(offset_, data_.size());
    const auto count = std::min(buffer.size(), available);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, count);
        offset_ += count;
    }
    return Result<std::size_t>::ok(count);
}

auto memory_source::do_position() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(static_cast<uint64_t>(offset_));
}

auto memory_source::do_seek(uint64_t offset) -> VoidResult {
    if (offset > data_.size()) {
        return make_stream_void_error(
            error_codes::seek_error,
            compat::format("Seek to {} beyond end of {}-byte buffer", offset, data_.size()));
    }
    offset_ = static_cast<std::size_t>(offset);
    return ok();
}

auto memory_source::do_size() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(static_cast<uint64_t>(data_.size()));
}

}  // namespace dcmstream::io
