#ifndef DCMSTREAM_ENCODING_CHARACTER_SET_HPP
#define DCMSTREAM_ENCODING_CHARACTER_SET_HPP

#include "dcmstream/core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dcmstream::encoding {

/**
 * @brief Character repertoire announced by Specific Character Set (0008,0005)
 *
 * Governs how text values (SH, LO, ST, LT, UC, UT, PN) are turned into
 * UTF-8. Character sets relying on ISO 2022 code extensions are not
 * supported.
 *
 * @see DICOM PS3.3 Section C.12.1.1.2 - Specific Character Set
 */
class specific_character_set {
public:
    enum class repertoire : uint8_t {
        default_repertoire,  ///< ISO_IR 6 (ASCII), also the empty term
        latin1,              ///< ISO_IR 100
        utf8,                ///< ISO_IR 192
    };

    constexpr specific_character_set() noexcept = default;

    explicit constexpr specific_character_set(repertoire rep) noexcept : repertoire_{rep} {}

    /**
     * @brief Resolve a defined term such as "ISO_IR 192"
     *
     * Padding is trimmed. For a multi-valued term only the first value
     * selects the repertoire.
     */
    [[nodiscard]] static auto from_term(std::string_view term) -> Result<specific_character_set>;

    [[nodiscard]] constexpr auto get() const noexcept -> repertoire { return repertoire_; }

    /**
     * @brief The defined term of this character set ("" for the default)
     */
    [[nodiscard]] auto term() const noexcept -> std::string_view;

    /**
     * @brief Convert encoded text to UTF-8
     */
    [[nodiscard]] auto decode(std::span<const uint8_t> bytes) const -> Result<std::string>;

    [[nodiscard]] constexpr auto operator==(const specific_character_set& other) const noexcept
        -> bool = default;

private:
    repertoire repertoire_{repertoire::default_repertoire};
};

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_CHARACTER_SET_HPP
