/**
 * @file dicom_tag.cpp
 * @brief Tag parsing and formatting
 */

#include "dcmstream/core/dicom_tag.hpp"

#include <array>
#include <charconv>

namespace dcmstream::core {

namespace {

constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

/// Parse exactly four hex digits; from_chars alone would accept fewer.
auto parse_hex_word(std::string_view text) noexcept -> std::optional<uint16_t> {
    if (text.size() != 4) {
        return std::nullopt;
    }
    uint16_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [end, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || end != last) {
        return std::nullopt;
    }
    return value;
}

void append_hex_word(std::string& out, uint16_t value) {
    for (int shift = 12; shift >= 0; shift -= 4) {
        out += kHexDigits[(value >> shift) & 0xF];
    }
}

auto trim(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
        str.remove_suffix(1);
    }
    return str;
}

}  // namespace

auto dicom_tag::from_string(std::string_view str) -> std::optional<dicom_tag> {
    str = trim(str);

    std::string_view group_text;
    std::string_view element_text;

    if (str.size() == 11 && str.front() == '(' && str.back() == ')' && str[5] == ',') {
        group_text = str.substr(1, 4);
        element_text = str.substr(6, 4);
    } else if (str.size() == 8) {
        group_text = str.substr(0, 4);
        element_text = str.substr(4, 4);
    } else {
        return std::nullopt;
    }

    const auto group = parse_hex_word(group_text);
    const auto element = parse_hex_word(element_text);
    if (!group || !element) {
        return std::nullopt;
    }
    return dicom_tag{*group, *element};
}

auto dicom_tag::to_string() const -> std::string {
    std::string result;
    result.reserve(11);
    result += '(';
    append_hex_word(result, group());
    result += ',';
    append_hex_word(result, element());
    result += ')';
    return result;
}

}  // namespace dcmstream::core
