/**
 * @file character_set.cpp
 * @brief Specific Character Set resolution and text decoding
 */

#include "dcmstream/encoding/character_set.hpp"

#include <dcmstream/compat/format.hpp>

#include <utility>

namespace dcmstream::encoding {

namespace {

auto trim_padding(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\0')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\0')) {
        text.remove_suffix(1);
    }
    return text;
}

/// Number of continuation bytes implied by a UTF-8 lead byte, -1 if invalid.
auto utf8_continuations(uint8_t lead) -> int {
    if (lead < 0x80) {
        return 0;
    }
    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
        return 1;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 2;
    }
    if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
        return 3;
    }
    return -1;
}

/// Allowed range of the byte after a multi-byte lead (RFC 3629 Section 4).
auto second_byte_range(uint8_t lead) -> std::pair<uint8_t, uint8_t> {
    switch (lead) {
        case 0xE0:
            return {0xA0, 0xBF};  // no overlong forms
        case 0xED:
            return {0x80, 0x9F};  // no UTF-16 surrogates
        case 0xF0:
            return {0x90, 0xBF};  // no overlong forms
        case 0xF4:
            return {0x80, 0x8F};  // nothing above U+10FFFF
        default:
            return {0x80, 0xBF};
    }
}

auto validate_utf8(std::span<const uint8_t> bytes) -> bool {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        const int extra = utf8_continuations(lead);
        if (extra < 0) {
            return false;
        }
        if (i + static_cast<std::size_t>(extra) >= bytes.size()) {
            return false;
        }
        if (extra > 0) {
            const auto [low, high] = second_byte_range(lead);
            if (bytes[i + 1] < low || bytes[i + 1] > high) {
                return false;
            }
        }
        for (int k = 2; k <= extra; ++k) {
            if ((bytes[i + static_cast<std::size_t>(k)] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += static_cast<std::size_t>(extra) + 1;
    }
    return true;
}

}  // namespace

auto specific_character_set::from_term(std::string_view term) -> Result<specific_character_set> {
    // Only the first value selects the base repertoire
    if (const auto sep = term.find('\\'); sep != std::string_view::npos) {
        term = term.substr(0, sep);
    }
    term = trim_padding(term);

    if (term.empty() || term == "ISO_IR 6") {
        return Result<specific_character_set>::ok(
            specific_character_set{repertoire::default_repertoire});
    }
    if (term == "ISO_IR 100") {
        return Result<specific_character_set>::ok(specific_character_set{repertoire::latin1});
    }
    if (term == "ISO_IR 192") {
        return Result<specific_character_set>::ok(specific_character_set{repertoire::utf8});
    }
    return make_stream_error<specific_character_set>(
        error_codes::unsupported_character_set,
        compat::format("Unsupported specific character set '{}'", term));
}

auto specific_character_set::term() const noexcept -> std::string_view {
    switch (repertoire_) {
        case repertoire::latin1:
            return "ISO_IR 100";
        case repertoire::utf8:
            return "ISO_IR 192";
        case repertoire::default_repertoire:
        default:
            return "";
    }
}

auto specific_character_set::decode(std::span<const uint8_t> bytes) const -> Result<std::string> {
    std::string out;
    out.reserve(bytes.size());

    switch (repertoire_) {
        case repertoire::default_repertoire:
            for (const auto byte : bytes) {
                if (byte >= 0x80) {
                    return make_stream_error<std::string>(
                        error_codes::decode_error,
                        compat::format("Byte 0x{:02X} outside the default repertoire", byte));
                }
                out += static_cast<char>(byte);
            }
            break;

        case repertoire::latin1:
            // Latin-1 code points map one to one onto U+0000..U+00FF
            for (const auto byte : bytes) {
                if (byte < 0x80) {
                    out += static_cast<char>(byte);
                } else {
                    out += static_cast<char>(0xC0 | (byte >> 6));
                    out += static_cast<char>(0x80 | (byte & 0x3F));
                }
            }
            break;

        case repertoire::utf8:
            if (!validate_utf8(bytes)) {
                return make_stream_error<std::string>(error_codes::decode_error,
                                                      "Malformed UTF-8 text value");
            }
            out.assign(bytes.begin(), bytes.end());
            break;
    }

    return Result<std::string>::ok(std::move(out));
}

}  // namespace dcmstream::encoding
