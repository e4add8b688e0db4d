/**
 * @file element_header.cpp
 * @brief Human-readable form of element headers
 */

#include "dcmstream/core/element_header.hpp"

#include <dcmstream/compat/format.hpp>

namespace dcmstream::core {

auto element_header::to_string() const -> std::string {
    if (has_undefined_length()) {
        return dcmstream::compat::format("{} {} len=undefined", tag.to_string(),
                                         encoding::to_string(vr));
    }
    return dcmstream::compat::format("{} {} len={}", tag.to_string(),
                                     encoding::to_string(vr), length);
}

}  // namespace dcmstream::core
