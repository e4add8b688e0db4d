/**
 * @file stream_options.hpp
 * @brief Configuration of element streams
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dcmstream::parser {

/**
 * @struct stream_options
 * @brief Options applied when creating an element stream
 */
struct stream_options {
    /// Transfer Syntax UID of the data set (default: Explicit VR Little Endian)
    std::string transfer_syntax_uid{"1.2.840.10008.1.2.1"};

    /// Initial Specific Character Set defined term ("" is ISO_IR 6)
    std::string character_set{};

    /// Maximum number of nested sequences
    std::size_t max_depth{64};

    /// Largest value the eager stream will materialize, in bytes
    uint64_t max_value_length{256ULL * 1024 * 1024};

    /// Log entering and leaving sequences at debug level
    bool trace_structure{false};

    /// Install the Specific Character Set handler
    bool register_default_handlers{true};
};

}  // namespace dcmstream::parser
