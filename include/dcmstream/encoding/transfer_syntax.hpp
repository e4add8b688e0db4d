#ifndef DCMSTREAM_ENCODING_TRANSFER_SYNTAX_HPP
#define DCMSTREAM_ENCODING_TRANSFER_SYNTAX_HPP

#include "dcmstream/encoding/byte_order.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcmstream::encoding {

/**
 * @brief Encoding rules of a data set, identified by a Transfer Syntax UID.
 *
 * Only the rules that affect walking the data set are kept: byte order,
 * implicit or explicit VR, and whether pixel data is encapsulated. A
 * syntax is supported when its data set can be walked without first
 * inflating it, i.e. every known syntax except deflate.
 *
 * @see DICOM PS3.5 Section 10 - Transfer Syntax
 */
class transfer_syntax {
public:
    /**
     * @brief Look up a UID in the registry.
     *
     * Trailing NUL or space padding (as found in UI values) is ignored.
     * Unknown UIDs produce an invalid, unsupported instance.
     */
    explicit transfer_syntax(std::string_view uid);

    [[nodiscard]] std::string_view uid() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] byte_order endianness() const noexcept;
    [[nodiscard]] vr_encoding vr_type() const noexcept;

    /**
     * @brief Pixel data is a sequence of compressed fragments.
     */
    [[nodiscard]] bool is_encapsulated() const noexcept;

    /**
     * @brief The whole data set is deflate-compressed.
     */
    [[nodiscard]] bool is_deflated() const noexcept;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] bool is_supported() const noexcept;

    static const transfer_syntax implicit_vr_little_endian;
    static const transfer_syntax explicit_vr_little_endian;
    static const transfer_syntax explicit_vr_big_endian;
    static const transfer_syntax deflated_explicit_vr_little_endian;

    bool operator==(const transfer_syntax& other) const noexcept;

private:
    std::string uid_;
    std::string_view name_;
    byte_order endianness_;
    vr_encoding vr_type_;
    bool encapsulated_;
    bool deflated_;
    bool valid_;
};

/**
 * @brief Look up a Transfer Syntax by UID.
 * @return The transfer syntax, or nullopt for an unknown UID
 */
[[nodiscard]] std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid);

/**
 * @brief All registered syntaxes whose data set can be walked.
 */
[[nodiscard]] std::vector<transfer_syntax> supported_transfer_syntaxes();

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_TRANSFER_SYNTAX_HPP
