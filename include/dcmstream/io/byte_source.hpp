/**
 * @file byte_source.hpp
 * @brief Byte sources consumed by the codec and the element streams
 *
 * Two capability levels exist:
 * - byte_source: sequential reads and a consumed-byte position
 * - seekable_source: adds absolute seeking, total size and leasing
 *
 * Public operations are non-virtual and validate state (e.g. an active
 * lease) before dispatching to the protected do_* hooks that concrete
 * sources implement.
 */

#pragma once

#include "dcmstream/core/result.hpp"

#include <cstdint>
#include <span>

namespace dcmstream::io {

class bounded_source;

/**
 * @brief Sequential source of bytes
 *
 * Thread Safety: NOT thread-safe. A source is owned by one consumer at a time.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    byte_source(const byte_source&) = delete;
    auto operator=(const byte_source&) -> byte_source& = delete;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read; 0 only at the end of the source
     */
    [[nodiscard]] auto read(std::span<uint8_t> buffer) -> Result<std::size_t>;

    /**
     * @brief Fill the whole buffer or fail with insufficient_data
     */
    [[nodiscard]] auto read_exact(std::span<uint8_t> buffer) -> VoidResult;

    /**
     * @brief Advance past count bytes without returning them
     */
    [[nodiscard]] auto skip(uint64_t count) -> VoidResult;

    /**
     * @brief Offset of the next byte to be read
     *
     * For seekable sources this is the absolute offset; for sequential
     * sources it is the number of bytes consumed since construction.
     */
    [[nodiscard]] auto position() const -> Result<uint64_t>;

    /**
     * @brief True when no further byte can be read
     */
    [[nodiscard]] auto at_end() -> Result<bool>;

    /**
     * @brief True while a bounded window holds this source
     */
    [[nodiscard]] auto is_leased() const noexcept -> bool { return leased_; }

protected:
    byte_source() = default;

    virtual auto do_read(std::span<uint8_t> buffer) -> Result<std::size_t> = 0;
    virtual auto do_skip(uint64_t count) -> VoidResult;
    virtual auto do_position() const -> Result<uint64_t> = 0;
    virtual auto do_at_end() -> Result<bool> = 0;

    [[nodiscard]] auto check_not_leased() const -> VoidResult;

private:
    friend class bounded_source;

    bool leased_{false};
};

/**
 * @brief Byte source with random access
 *
 * Required by the lazy element stream and by element markers, which record
 * absolute offsets and come back to them later.
 */
class seekable_source : public byte_source {
public:
    /**
     * @brief Move to an absolute offset; offset == size() is allowed
     */
    [[nodiscard]] auto seek(uint64_t offset) -> VoidResult;

    /**
     * @brief Total number of bytes addressable through seek()
     */
    [[nodiscard]] auto size() const -> Result<uint64_t>;

protected:
    seekable_source() = default;

    virtual auto do_seek(uint64_t offset) -> VoidResult = 0;
    virtual auto do_size() const -> Result<uint64_t> = 0;

    auto do_skip(uint64_t count) -> VoidResult override;
    auto do_at_end() -> Result<bool> override;

private:
    friend class bounded_source;
};

}  // namespace dcmstream::io
