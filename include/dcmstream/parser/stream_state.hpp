/**
 * @file stream_state.hpp
 * @brief Nesting automaton shared by the eager and lazy element streams
 */

#pragma once

#include "dcmstream/core/dicom_tag.hpp"
#include "dcmstream/core/result.hpp"
#include "dcmstream/encoding/character_set.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace dcmstream::parser {

/**
 * @brief What the stream expects next at one nesting level
 */
enum class frame_kind : uint8_t {
    sequence,  ///< Awaiting an item boundary (Item, ItemDelimiter, SequenceDelimiter)
    item,      ///< Awaiting a regular element header
};

/**
 * @brief One level of the nesting stack
 */
struct frame {
    frame_kind kind{frame_kind::sequence};

    /// Tag of the sequence element that opened the level (Item tag for items)
    core::dicom_tag tag{};

    /// Absolute end offset for defined-length sequences and items
    std::optional<uint64_t> end_offset{};

    /// Encapsulated pixel data: items are fragments, not nested data sets
    bool encapsulated{false};

    /// Contents are Implicit VR Little Endian (inherited by nested frames)
    bool implicit_vr{false};

    /// Character set in effect when the frame was opened
    encoding::specific_character_set charset{};

    [[nodiscard]] auto is_sequence() const noexcept -> bool {
        return kind == frame_kind::sequence;
    }

    [[nodiscard]] auto operator==(const frame& other) const -> bool = default;
};

/**
 * @brief Frame stack plus terminal flag
 *
 * Depth is the number of sequence frames on the stack, so a top-level
 * element is read at depth 0 and the elements of a first-level item at
 * depth 1. An empty stack means top-level elements are expected.
 *
 * Transitions that would break the bracketing (closing a sequence that is
 * not open, entering an item outside a sequence) fail with
 * invalid_sequence and leave the stack unchanged.
 */
class stream_state {
public:
    explicit stream_state(std::size_t max_depth = 64) noexcept : max_depth_(max_depth) {}

    [[nodiscard]] auto depth() const noexcept -> std::size_t { return depth_; }

    [[nodiscard]] auto max_depth() const noexcept -> std::size_t { return max_depth_; }

    [[nodiscard]] auto empty() const noexcept -> bool { return frames_.empty(); }

    /**
     * @brief True when the next token must be an item boundary
     */
    [[nodiscard]] auto is_awaiting_item() const noexcept -> bool {
        return !frames_.empty() && frames_.back().is_sequence();
    }

    /**
     * @brief True while inside a data set item
     */
    [[nodiscard]] auto in_item() const noexcept -> bool {
        return !frames_.empty() && !frames_.back().is_sequence();
    }

    /**
     * @brief True while reading the fragments of encapsulated pixel data
     */
    [[nodiscard]] auto in_encapsulated() const noexcept -> bool {
        return is_awaiting_item() && frames_.back().encapsulated;
    }

    /**
     * @brief True while the innermost frame holds Implicit VR Little Endian
     *        contents, whatever the transfer syntax
     */
    [[nodiscard]] auto in_implicit_vr() const noexcept -> bool {
        return !frames_.empty() && frames_.back().implicit_vr;
    }

    [[nodiscard]] auto is_terminal() const noexcept -> bool { return terminal_; }

    [[nodiscard]] auto frames() const noexcept -> const std::vector<frame>& { return frames_; }

    /**
     * @brief Push a sequence frame (depth + 1)
     *
     * implicit_vr marks a sequence whose value is encoded in Implicit VR
     * Little Endian, such as an undefined-length UN element.
     *
     * @return nesting_too_deep beyond max_depth
     */
    [[nodiscard]] auto enter_sequence(core::dicom_tag tag, std::optional<uint64_t> end_offset,
                                      bool encapsulated = false, bool implicit_vr = false)
        -> VoidResult;

    /**
     * @brief Push an item frame on top of a sequence frame
     * @param charset Character set to restore when the item closes
     */
    [[nodiscard]] auto enter_item(std::optional<uint64_t> end_offset,
                                  encoding::specific_character_set charset = {}) -> VoidResult;

    /**
     * @brief Pop the item frame on ItemDelimiter
     * @return The closed item frame
     */
    [[nodiscard]] auto leave_item() -> Result<frame>;

    /**
     * @brief Pop the sequence frame on SequenceDelimiter (depth - 1)
     * @return invalid_sequence when no sequence is awaiting a boundary,
     *         in particular at depth 0
     */
    [[nodiscard]] auto leave_sequence() -> Result<frame>;

    /**
     * @brief Pop the innermost defined-length frame whose end is reached
     *
     * Call repeatedly until it yields nullopt; several frames can end at
     * the same offset.
     *
     * @return The closed frame, nullopt if none ended, or invalid_sequence
     *         if position has run past a frame end
     */
    [[nodiscard]] auto pop_completed(uint64_t position) -> Result<std::optional<frame>>;

    /**
     * @brief Mark the automaton terminal; no further items are produced
     */
    void set_terminal() noexcept { terminal_ = true; }

private:
    void pop() noexcept;

    std::vector<frame> frames_;
    std::size_t depth_{0};
    std::size_t max_depth_;
    bool terminal_{false};
};

}  // namespace dcmstream::parser
