/**
 * @file element_codec.hpp
 * @brief Header and value decoding interface used by the element streams
 */

#ifndef DCMSTREAM_ENCODING_ELEMENT_CODEC_HPP
#define DCMSTREAM_ENCODING_ELEMENT_CODEC_HPP

#include "dcmstream/core/dicom_value.hpp"
#include "dcmstream/core/element_header.hpp"
#include "dcmstream/core/result.hpp"
#include "dcmstream/encoding/character_set.hpp"
#include "dcmstream/encoding/transfer_syntax.hpp"
#include "dcmstream/io/byte_source.hpp"

#include <memory>

namespace dcmstream::encoding {

/**
 * @brief Decodes element headers, item boundaries and values of one
 *        transfer syntax
 *
 * A codec is stateless apart from the active character set, which the
 * element stream updates when it meets Specific Character Set (0008,0005).
 */
class element_codec {
public:
    virtual ~element_codec() = default;

    /**
     * @brief Decode the header of a regular element
     *
     * Items and delimiters (group FFFE) are returned with VR UN since they
     * carry no VR in any encoding.
     */
    [[nodiscard]] virtual auto decode_header(io::byte_source& source)
        -> Result<core::element_header> = 0;

    /**
     * @brief Decode an item boundary inside a sequence
     * @return invalid_sequence if the tag is not an item or a delimiter
     */
    [[nodiscard]] virtual auto decode_item_header(io::byte_source& source)
        -> Result<core::item_header> = 0;

    /**
     * @brief Read exactly header.length bytes and decode them by VR
     */
    [[nodiscard]] virtual auto read_value(io::byte_source& source,
                                          const core::element_header& header)
        -> Result<core::dicom_value> = 0;

    [[nodiscard]] virtual auto character_set() const noexcept
        -> const specific_character_set& = 0;

    virtual void set_character_set(specific_character_set charset) = 0;

    [[nodiscard]] virtual auto syntax() const noexcept -> const transfer_syntax& = 0;
};

/**
 * @brief Create the codec for a transfer syntax
 * @return unsupported_transfer_syntax for unknown or deflated syntaxes
 */
[[nodiscard]] auto make_codec(const transfer_syntax& ts, specific_character_set charset)
    -> Result<std::unique_ptr<element_codec>>;

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_ELEMENT_CODEC_HPP
