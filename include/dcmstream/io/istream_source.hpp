/**
 * @file istream_source.hpp
 * @brief Sequential byte source over a borrowed std::istream
 */

#pragma once

#include "dcmstream/io/byte_source.hpp"

#include <istream>

namespace dcmstream::io {

/**
 * @brief Non-seekable source reading from a caller-owned stream
 *
 * Suitable for pipes and sockets. Only the eager element stream accepts it.
 * The stream must outlive the source.
 */
class istream_source final : public byte_source {
public:
    explicit istream_source(std::istream& stream) noexcept : stream_(stream) {}

protected:
    auto do_read(std::span<uint8_t> buffer) -> Result<std::size_t> override;
    auto do_position() const -> Result<uint64_t> override;
    auto do_at_end() -> Result<bool> override;

private:
    std::istream& stream_;
    uint64_t consumed_{0};
};

}  // namespace dcmstream::io
