#ifndef DCMSTREAM_ENCODING_VR_TYPE_HPP
#define DCMSTREAM_ENCODING_VR_TYPE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dcmstream::encoding {

/**
 * @brief DICOM Value Representation (VR) codes.
 *
 * Each enumerator holds the two ASCII characters of the code, first character
 * in the high byte, so the value can be compared directly against the two
 * bytes read from an Explicit VR header.
 *
 * UN doubles as the "not applicable" VR of items and delimitation items.
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */
enum class vr_type : uint16_t {
    AE = 0x4145, AS = 0x4153, AT = 0x4154, CS = 0x4353, DA = 0x4441,
    DS = 0x4453, DT = 0x4454, FD = 0x4644, FL = 0x464C, IS = 0x4953,
    LO = 0x4C4F, LT = 0x4C54, OB = 0x4F42, OD = 0x4F44, OF = 0x4F46,
    OL = 0x4F4C, OV = 0x4F56, OW = 0x4F57, PN = 0x504E, SH = 0x5348,
    SL = 0x534C, SQ = 0x5351, SS = 0x5353, ST = 0x5354, SV = 0x5356,
    TM = 0x544D, UC = 0x5543, UI = 0x5549, UL = 0x554C, UN = 0x554E,
    UR = 0x5552, US = 0x5553, UT = 0x5554, UV = 0x5556,
};

/**
 * @brief How the bytes of a value are interpreted.
 */
enum class vr_category : uint8_t {
    text,       ///< Character data, possibly multi-valued with '\' separators
    integer,    ///< Fixed-size binary integers
    floating,   ///< Fixed-size IEEE floating point values
    tag,        ///< Attribute tags (AT)
    bytes,      ///< Opaque bytes, possibly swapped by word size (OB, OW, UN, ...)
    sequence,   ///< Nested items (SQ)
};

/**
 * @brief Static properties of one VR.
 */
struct vr_traits {
    vr_type vr;
    vr_category category;
    uint8_t element_size;    ///< Size of one binary value, 0 for text/sequence
    bool long_length;        ///< Explicit VR header uses reserved + 32-bit length
    bool multi_valued_text;  ///< Backslash separates values (not for LT/ST/UT/UR)
};

namespace detail {

// clang-format off
inline constexpr std::array<vr_traits, 34> kVrTable = {{
    {vr_type::AE, vr_category::text,     0, false, true},
    {vr_type::AS, vr_category::text,     0, false, true},
    {vr_type::AT, vr_category::tag,      4, false, false},
    {vr_type::CS, vr_category::text,     0, false, true},
    {vr_type::DA, vr_category::text,     0, false, true},
    {vr_type::DS, vr_category::text,     0, false, true},
    {vr_type::DT, vr_category::text,     0, false, true},
    {vr_type::FD, vr_category::floating, 8, false, false},
    {vr_type::FL, vr_category::floating, 4, false, false},
    {vr_type::IS, vr_category::text,     0, false, true},
    {vr_type::LO, vr_category::text,     0, false, true},
    {vr_type::LT, vr_category::text,     0, false, false},
    {vr_type::OB, vr_category::bytes,    1, true,  false},
    {vr_type::OD, vr_category::bytes,    8, true,  false},
    {vr_type::OF, vr_category::bytes,    4, true,  false},
    {vr_type::OL, vr_category::bytes,    4, true,  false},
    {vr_type::OV, vr_category::bytes,    8, true,  false},
    {vr_type::OW, vr_category::bytes,    2, true,  false},
    {vr_type::PN, vr_category::text,     0, false, true},
    {vr_type::SH, vr_category::text,     0, false, true},
    {vr_type::SL, vr_category::integer,  4, false, false},
    {vr_type::SQ, vr_category::sequence, 0, true,  false},
    {vr_type::SS, vr_category::integer,  2, false, false},
    {vr_type::ST, vr_category::text,     0, false, false},
    {vr_type::SV, vr_category::integer,  8, true,  false},
    {vr_type::TM, vr_category::text,     0, false, true},
    {vr_type::UC, vr_category::text,     0, true,  true},
    {vr_type::UI, vr_category::text,     0, false, true},
    {vr_type::UL, vr_category::integer,  4, false, false},
    {vr_type::UN, vr_category::bytes,    1, true,  false},
    {vr_type::UR, vr_category::text,     0, true,  false},
    {vr_type::US, vr_category::integer,  2, false, false},
    {vr_type::UT, vr_category::text,     0, true,  false},
    {vr_type::UV, vr_category::integer,  8, true,  false},
}};
// clang-format on

}  // namespace detail

/**
 * @brief Look up the traits of a VR code.
 * @return The traits, or nullopt for a code that is not a defined VR
 */
[[nodiscard]] constexpr std::optional<vr_traits> traits_of(vr_type vr) noexcept {
    for (const auto& entry : detail::kVrTable) {
        if (entry.vr == vr) {
            return entry;
        }
    }
    return std::nullopt;
}

/**
 * @brief Parse the two characters of an Explicit VR header.
 * @return The VR, or nullopt if the characters are not a defined VR
 */
[[nodiscard]] constexpr std::optional<vr_type> vr_from_chars(char first, char second) noexcept {
    const auto code = static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<unsigned char>(first)) << 8) |
        static_cast<uint16_t>(static_cast<unsigned char>(second)));
    if (!traits_of(static_cast<vr_type>(code))) {
        return std::nullopt;
    }
    return static_cast<vr_type>(code);
}

[[nodiscard]] constexpr std::optional<vr_type> from_string(std::string_view str) noexcept {
    if (str.size() != 2) {
        return std::nullopt;
    }
    return vr_from_chars(str[0], str[1]);
}

/**
 * @brief Two-character code of a VR, "??" for undefined codes.
 */
[[nodiscard]] constexpr std::string_view to_string(vr_type vr) noexcept {
    // Codes in kVrTable order
    constexpr std::string_view names =
        "AEASATCSDADSDTFDFLISLOLTOBODOFOLOVOWPNSHSLSQSSSTSVTMUCUIULUNURUSUTUV";
    for (std::size_t i = 0; i < detail::kVrTable.size(); ++i) {
        if (detail::kVrTable[i].vr == vr) {
            return names.substr(i * 2, 2);
        }
    }
    return "??";
}

[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    const auto t = traits_of(vr);
    return t && t->category == vr_category::text;
}

[[nodiscard]] constexpr bool is_numeric_vr(vr_type vr) noexcept {
    const auto t = traits_of(vr);
    return t && (t->category == vr_category::integer || t->category == vr_category::floating);
}

[[nodiscard]] constexpr bool is_binary_vr(vr_type vr) noexcept {
    const auto t = traits_of(vr);
    return t && t->category == vr_category::bytes;
}

/**
 * @brief True when an Explicit VR header carries 2 reserved bytes and a
 *        32-bit length for this VR.
 *
 * @see DICOM PS3.5 Section 7.1.2
 */
[[nodiscard]] constexpr bool has_explicit_32bit_length(vr_type vr) noexcept {
    const auto t = traits_of(vr);
    return t && t->long_length;
}

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_VR_TYPE_HPP
