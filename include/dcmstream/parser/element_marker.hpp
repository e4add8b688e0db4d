/**
 * @file element_marker.hpp
 * @brief Position of an element value for deferred reading
 */

#pragma once

#include "dcmstream/core/element_header.hpp"
#include "dcmstream/core/result.hpp"
#include "dcmstream/io/bounded_source.hpp"

#include <cstdint>
#include <memory>

namespace dcmstream::parser {

/**
 * @brief Element header plus the absolute offset of its first value byte
 *
 * Produced by lazy_element_stream. A marker owns no value bytes and its
 * offset is only meaningful for the source it was produced from.
 *
 * @code
 * auto window = marker.bind_value(source);
 * if (window.is_ok()) {
 *     auto bytes = window.value()->read_all();
 * }
 * @endcode
 */
class element_marker {
public:
    element_marker() = default;

    element_marker(const core::element_header& header, uint64_t position) noexcept
        : header_(header), position_(position) {}

    /**
     * @brief Lease a window over exactly the value bytes
     *
     * Fails with invalid_length_encoding for undefined lengths, and with
     * source_leased if another window is still alive on the source.
     */
    [[nodiscard]] auto bind_value(io::seekable_source& source) const
        -> Result<std::unique_ptr<io::bounded_source>>;

    /**
     * @brief Seek the source to the first value byte
     */
    [[nodiscard]] auto move_to_start(io::seekable_source& source) const -> VoidResult;

    [[nodiscard]] auto header() const noexcept -> const core::element_header& {
        return header_;
    }

    [[nodiscard]] auto tag() const noexcept -> core::dicom_tag { return header_.tag; }

    [[nodiscard]] auto vr() const noexcept -> encoding::vr_type { return header_.vr; }

    [[nodiscard]] auto length() const noexcept -> uint32_t { return header_.length; }

    [[nodiscard]] auto position() const noexcept -> uint64_t { return position_; }

    [[nodiscard]] auto operator==(const element_marker& other) const noexcept -> bool = default;

private:
    core::element_header header_{};
    uint64_t position_{0};
};

}  // namespace dcmstream::parser
