/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the element stream library
 *
 * All fallible operations in dcmstream report failures through the
 * common_system Result pattern instead of exceptions.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dcmstream {

/**
 * @brief Result type alias for dcmstream operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/// Module name attached to every error raised by this library
inline constexpr const char* error_module = "dcmstream";

/**
 * @namespace error_codes
 * @brief dcmstream error codes
 *
 * Error code range: -700 to -749
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int stream_base = -700;

    // Byte source errors (-700 to -709)
    constexpr int file_not_found = stream_base - 0;
    constexpr int file_read_error = stream_base - 1;
    constexpr int seek_error = stream_base - 2;
    constexpr int position_error = stream_base - 3;
    constexpr int source_leased = stream_base - 4;

    // Decoding errors (-710 to -729)
    constexpr int decode_error = stream_base - 10;
    constexpr int insufficient_data = stream_base - 11;
    constexpr int unknown_vr = stream_base - 12;
    constexpr int invalid_tag_encoding = stream_base - 13;
    constexpr int invalid_length_encoding = stream_base - 14;
    constexpr int data_size_mismatch = stream_base - 15;
    constexpr int value_conversion_error = stream_base - 16;

    // Structural errors (-730 to -739)
    constexpr int invalid_sequence = stream_base - 30;
    constexpr int nesting_too_deep = stream_base - 31;
    constexpr int value_too_large = stream_base - 32;

    // Setup errors (-740 to -749)
    constexpr int unsupported_transfer_syntax = stream_base - 40;
    constexpr int unsupported_character_set = stream_base - 41;
    constexpr int invalid_argument = stream_base - 42;
}  // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create an error result tagged with the dcmstream module
 * @tparam T The result value type
 * @param code Error code from dcmstream::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> make_stream_error(int code, const std::string& message,
                                   const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, error_module);
    }
    return kcenon::common::make_error<T>(code, message, error_module, details);
}

/**
 * @brief Create a void error result tagged with the dcmstream module
 */
inline VoidResult make_stream_void_error(int code, const std::string& message,
                                         const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, error_module});
    }
    return VoidResult(error_info{code, message, error_module, details});
}

/**
 * @brief Re-wrap the error of one result as a result of another type
 */
template <typename T, typename R>
inline Result<T> forward_error(const R& source) {
    return Result<T>::err(source.error());
}

}  // namespace dcmstream
