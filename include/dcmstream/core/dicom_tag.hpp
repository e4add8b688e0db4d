/**
 * @file dicom_tag.hpp
 * @brief DICOM attribute tag (group, element pair)
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dcmstream::core {

/**
 * @brief Identifies an attribute in an encoded data set
 *
 * Stored as a single combined value (group << 16 | element), so the natural
 * ordering of the combined value is the (group, element) ordering.
 *
 * @code
 * dicom_tag name{0x0010, 0x0010};
 * auto parsed = dicom_tag::from_string("(0008,0005)");
 * @endcode
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept : combined_{0} {}

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : combined_{static_cast<uint32_t>(group) << 16 | element} {}

    explicit constexpr dicom_tag(uint32_t combined) noexcept
        : combined_{combined} {}

    /**
     * @brief Parse a tag from "(GGGG,EEEE)" or "GGGGEEEE"
     * @return The parsed tag, or nullopt when the text is not a tag
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<dicom_tag>;

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ & 0xFFFF);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t {
        return combined_;
    }

    /**
     * @brief Private tags have an odd group number above 0x0008
     */
    [[nodiscard]] constexpr auto is_private() const noexcept -> bool {
        const auto grp = group();
        return (grp & 1) != 0 && grp > 0x0008;
    }

    /**
     * @brief Private creator tags are (gggg,0010)-(gggg,00FF) in a private group
     */
    [[nodiscard]] constexpr auto is_private_creator() const noexcept -> bool {
        const auto elem = element();
        return is_private() && elem >= 0x0010 && elem <= 0x00FF;
    }

    [[nodiscard]] constexpr auto is_group_length() const noexcept -> bool {
        return element() == 0x0000;
    }

    /**
     * @brief Items and delimitation items live in group FFFE
     *
     * Tags in this group never carry an explicit VR and are structural
     * markers rather than attributes.
     */
    [[nodiscard]] constexpr auto is_structural() const noexcept -> bool {
        return group() == 0xFFFE;
    }

    /**
     * @brief Format as "(GGGG,EEEE)" with uppercase hex digits
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag& other) const noexcept
        -> std::strong_ordering = default;

    [[nodiscard]] constexpr auto operator==(const dicom_tag& other) const noexcept
        -> bool = default;

private:
    uint32_t combined_;
};

}  // namespace dcmstream::core

template <>
struct std::hash<dcmstream::core::dicom_tag> {
    [[nodiscard]] auto operator()(const dcmstream::core::dicom_tag& tag) const noexcept
        -> size_t {
        return std::hash<uint32_t>{}(tag.combined());
    }
};
