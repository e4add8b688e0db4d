/**
 * @file bounded_source.hpp
 * @brief Exclusive read window over a range of a seekable source
 */

#pragma once

#include "dcmstream/io/byte_source.hpp"

#include <memory>
#include <vector>

namespace dcmstream::io {

/**
 * @brief Window onto [start, start + length) of a parent source
 *
 * While the window exists it holds a lease on the parent: public read,
 * skip and seek on the parent fail with source_leased. Destroying the
 * window releases the lease; the parent is left wherever the window last
 * read and is not rewound.
 *
 * Positions, sizes and seek offsets are relative to the window start.
 */
class bounded_source final : public seekable_source {
public:
    /**
     * @brief Lease a window of the parent
     *
     * Fails with source_leased if the parent already has a window, and
     * with invalid_argument if the range does not fit in the parent.
     */
    [[nodiscard]] static auto create(seekable_source& parent, uint64_t start,
                                     uint64_t length)
        -> Result<std::unique_ptr<bounded_source>>;

    ~bounded_source() override;

    bounded_source(bounded_source&&) = delete;
    auto operator=(bounded_source&&) -> bounded_source& = delete;

    [[nodiscard]] auto start() const noexcept -> uint64_t { return start_; }
    [[nodiscard]] auto length() const noexcept -> uint64_t { return length_; }

    /**
     * @brief Read every remaining byte of the window
     */
    [[nodiscard]] auto read_all() -> Result<std::vector<uint8_t>>;

protected:
    auto do_read(std::span<uint8_t> buffer) -> Result<std::size_t> override;
    auto do_position() const -> Result<uint64_t> override;
    auto do_seek(uint64_t offset) -> VoidResult override;
    auto do_size() const -> Result<uint64_t> override;

private:
    bounded_source(seekable_source& parent, uint64_t start, uint64_t length) noexcept;

    seekable_source* parent_;
    uint64_t start_;
    uint64_t length_;
    uint64_t offset_{0};
};

}  // namespace dcmstream::io
