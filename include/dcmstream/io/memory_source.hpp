/**
 * @file memory_source.hpp
 * @brief Seekable byte source over a buffer in memory
 */

#pragma once

#include "dcmstream/io/byte_source.hpp"

#include <vector>

namespace dcmstream::io {

/**
 * @brief Seekable source over an owned vector or a borrowed span
 *
 * A borrowed span must outlive the source.
 */
class memory_source final : public seekable_source {
public:
    explicit memory_source(std::vector<uint8_t> bytes);

    explicit memory_source(std::span<const uint8_t> bytes) noexcept;

    /**
     * @brief The whole underlying buffer
     */
    [[nodiscard]] auto data() const noexcept -> std::span<const uint8_t> { return data_; }

protected:
    auto do_read(std::span<uint8_t> buffer) -> Result<std::size_t> override;
    auto do_position() const -> Result<uint64_t> override;
    auto do_seek(uint64_t offset) -> VoidResult override;
    auto do_size() const -> Result<uint64_t> override;

private:
    std::vector<uint8_t> owned_;
    std::span<const uint8_t> data_;
    std::size_t offset_{0};
};

}  // namespace dcmstream::io
