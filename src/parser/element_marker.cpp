/**
 * @file element_marker.cpp
 * @brief Deferred value access through element markers
 */

#include "dcmstream/parser/element_marker.hpp"

#include <dcmstream/compat/format.hpp>

namespace dcmstream::parser {

auto element_marker::bind_value(io::seekable_source& source) const
    -> Result<std::unique_ptr<io::bounded_source>> {
    if (header_.has_undefined_length()) {
        return make_stream_error<std::unique_ptr<io::bounded_source>>(
            error_codes::invalid_length_encoding,
            compat::format("Element {} has undefined length and no value window",
                           header_.tag.to_string()));
    }
    return io::bounded_source::create(source, position_, header_.length);
}

auto element_marker::move_to_start(io::seekable_source& source) const -> VoidResult {
    return source.seek(position_);
}

}  // namespace dcmstream::parser
