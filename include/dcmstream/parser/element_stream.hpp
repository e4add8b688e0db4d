/**
 * @file element_stream.hpp
 * @brief Streaming walkers over an encoded data set
 *
 * basic_element_stream turns a flat byte stream into a finite, forward-only
 * sequence of items while tracking sequence nesting. The walking logic is
 * shared; a strategy decides what an item is:
 *
 * - element_stream: decoded_element values, read from any byte_source
 * - lazy_element_stream: element_marker positions, values are skipped and
 *   can be fetched later from the seekable_source
 *
 * Sequences are reported inline: the sequence element itself, then per item
 * an Item boundary, the item's elements and an ItemDelimiter (if encoded),
 * and finally the SequenceDelimiter (if encoded). Defined-length sequences
 * and items close silently when their last byte has been consumed.
 *
 * An undefined-length UN element is walked as a sequence whose contents are
 * decoded as Implicit VR Little Endian. A Specific Character Set found in an
 * item applies until that item closes.
 *
 * @see DICOM PS3.5 Section 7.5 - Nesting of Data Sets
 */

#pragma once

#include "dcmstream/core/decoded_element.hpp"
#include "dcmstream/core/result.hpp"
#include "dcmstream/encoding/element_codec.hpp"
#include "dcmstream/io/byte_source.hpp"
#include "dcmstream/parser/element_marker.hpp"
#include "dcmstream/parser/special_attributes.hpp"
#include "dcmstream/parser/stream_options.hpp"
#include "dcmstream/parser/stream_state.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace dcmstream::parser {

// =============================================================================
// Strategies
// =============================================================================

/**
 * @brief Materializes every value as it is walked
 */
struct eager_strategy {
    using source_type = io::byte_source;
    using item_type = core::decoded_element;

    static constexpr const char* name = "eager";

    [[nodiscard]] static auto make_item(const core::element_header& header, uint64_t position,
                                        core::dicom_value value) -> item_type;

    /**
     * @brief Read and decode the value following header
     * @return value_too_large beyond stream_options::max_value_length
     */
    [[nodiscard]] static auto take_value(source_type& source, encoding::element_codec& codec,
                                         const core::element_header& header, uint64_t position,
                                         const stream_options& options) -> Result<item_type>;
};

/**
 * @brief Records value positions and seeks past the values
 */
struct lazy_strategy {
    using source_type = io::seekable_source;
    using item_type = element_marker;

    static constexpr const char* name = "lazy";

    [[nodiscard]] static auto make_item(const core::element_header& header, uint64_t position,
                                        core::dicom_value value) -> item_type;

    [[nodiscard]] static auto take_value(source_type& source, encoding::element_codec& codec,
                                         const core::element_header& header, uint64_t position,
                                         const stream_options& options) -> Result<item_type>;
};

// =============================================================================
// Walker
// =============================================================================

/**
 * @brief Element stream over a borrowed byte source
 *
 * next() returns std::nullopt at the end of the stream. The first failure
 * is returned once as an error result; every later call returns
 * std::nullopt. The walker never retries or resynchronizes.
 *
 * Thread Safety: NOT thread-safe. The source must not be used by anyone
 * else while the walker is stepping.
 *
 * @code
 * io::memory_source source(std::move(bytes));
 * auto stream = element_stream::create(source);
 * if (stream.is_err()) { ... }
 * while (auto item = stream.value().next()) {
 *     if (item->is_err()) { ... break; }
 *     const auto& element = item->value();
 * }
 * @endcode
 */
template <typename Strategy>
class basic_element_stream {
public:
    using strategy_type = Strategy;
    using source_type = typename Strategy::source_type;
    using item_type = typename Strategy::item_type;

    /**
     * @brief Create a walker for the transfer syntax named in options
     * @return unsupported_transfer_syntax or unsupported_character_set
     */
    [[nodiscard]] static auto create(source_type& source, stream_options options = {})
        -> Result<basic_element_stream>;

    basic_element_stream(basic_element_stream&&) noexcept = default;
    auto operator=(basic_element_stream&&) noexcept -> basic_element_stream& = default;

    basic_element_stream(const basic_element_stream&) = delete;
    auto operator=(const basic_element_stream&) -> basic_element_stream& = delete;

    ~basic_element_stream() = default;

    /**
     * @brief Produce the next item
     * @return nullopt at end of stream, an error exactly once on failure
     */
    [[nodiscard]] auto next() -> std::optional<Result<item_type>>;

    /**
     * @brief False once the end was reached or a failure was reported
     */
    [[nodiscard]] auto has_more() const noexcept -> bool { return !is_exhausted(); }

    [[nodiscard]] auto is_exhausted() const noexcept -> bool {
        return finished_ || state_.is_terminal();
    }

    /// Number of open sequences
    [[nodiscard]] auto depth() const noexcept -> std::size_t { return state_.depth(); }

    [[nodiscard]] auto is_awaiting_item() const noexcept -> bool {
        return state_.is_awaiting_item();
    }

    [[nodiscard]] auto state() const noexcept -> const stream_state& { return state_; }

    [[nodiscard]] auto codec() const noexcept -> const encoding::element_codec& {
        return *codec_;
    }

    [[nodiscard]] auto codec() noexcept -> encoding::element_codec& { return *codec_; }

    /**
     * @brief Special attribute handlers; may be changed between steps
     */
    [[nodiscard]] auto handlers() noexcept -> special_attribute_registry& { return handlers_; }

    [[nodiscard]] auto options() const noexcept -> const stream_options& { return options_; }

    /// Number of items produced so far
    [[nodiscard]] auto items_read() const noexcept -> std::size_t { return items_read_; }

private:
    basic_element_stream(source_type& source, std::unique_ptr<encoding::element_codec> codec,
                         std::unique_ptr<encoding::element_codec> implicit_codec,
                         stream_options options);

    auto step() -> Result<std::optional<item_type>>;
    auto step_item_boundary() -> Result<std::optional<item_type>>;
    auto step_element() -> Result<std::optional<item_type>>;
    auto close_completed_frames() -> VoidResult;

    /// Codec for the innermost frame: the implicit one inside UN sequences
    auto active_codec() noexcept -> encoding::element_codec&;
    void set_character_set(const encoding::specific_character_set& charset);
    void restore_character_set(const frame& item);

    void trace(const char* event, core::dicom_tag tag) const;

    source_type* source_;
    std::unique_ptr<encoding::element_codec> codec_;
    std::unique_ptr<encoding::element_codec> implicit_codec_;
    stream_options options_;
    special_attribute_registry handlers_;
    stream_state state_;
    bool finished_{false};
    std::size_t items_read_{0};
};

/// Walker yielding fully decoded elements
using element_stream = basic_element_stream<eager_strategy>;

/// Walker yielding element markers over a seekable source
using lazy_element_stream = basic_element_stream<lazy_strategy>;

extern template class basic_element_stream<eager_strategy>;
extern template class basic_element_stream<lazy_strategy>;

}  // namespace dcmstream::parser
