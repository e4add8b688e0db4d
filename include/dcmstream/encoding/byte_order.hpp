#ifndef DCMSTREAM_ENCODING_BYTE_ORDER_HPP
#define DCMSTREAM_ENCODING_BYTE_ORDER_HPP

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

namespace dcmstream::encoding {

/**
 * @brief Byte ordering of binary fields in the encoded stream.
 */
enum class byte_order {
    little_endian,  ///< Least significant byte first (all current syntaxes)
    big_endian      ///< Most significant byte first (retired Explicit VR Big Endian)
};

/**
 * @brief Whether the VR is written in element headers.
 */
enum class vr_encoding {
    implicit,    ///< VR comes from the data dictionary
    explicit_vr  ///< VR is the two characters following the tag
};

/**
 * @brief Read an unsigned integer of width sizeof(T) in the given order.
 *
 * @p bytes must hold at least sizeof(T) bytes.
 */
template <typename T>
[[nodiscard]] constexpr T read_uint(std::span<const uint8_t> bytes, byte_order order) noexcept {
    T value = 0;
    if (order == byte_order::little_endian) {
        for (std::size_t i = sizeof(T); i > 0; --i) {
            value = static_cast<T>((value << 8) | bytes[i - 1]);
        }
    } else {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | bytes[i]);
        }
    }
    return value;
}

/**
 * @brief Read any arithmetic type by reinterpreting the ordered bits.
 */
template <typename T>
[[nodiscard]] T read_value_as(std::span<const uint8_t> bytes, byte_order order) noexcept {
    if constexpr (sizeof(T) == 1) {
        return static_cast<T>(bytes[0]);
    } else if constexpr (sizeof(T) == 2) {
        return std::bit_cast<T>(read_uint<uint16_t>(bytes, order));
    } else if constexpr (sizeof(T) == 4) {
        return std::bit_cast<T>(read_uint<uint32_t>(bytes, order));
    } else {
        static_assert(sizeof(T) == 8, "unsupported value width");
        return std::bit_cast<T>(read_uint<uint64_t>(bytes, order));
    }
}

}  // namespace dcmstream::encoding

#endif  // DCMSTREAM_ENCODING_BYTE_ORDER_HPP
