/**
 * @file dicom_value.cpp
 * @brief Accessors and display form of materialized element values
 */

#include "dcmstream/core/dicom_value.hpp"

#include <dcmstream/compat/format.hpp>

namespace dcmstream::core {

auto dicom_value::is_empty() const noexcept -> bool {
    return multiplicity() == 0;
}

auto dicom_value::multiplicity() const noexcept -> std::size_t {
    return std::visit(
        [](const auto& values) -> std::size_t {
            using V = std::decay_t<decltype(values)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return 0;
            } else if constexpr (std::is_same_v<V, std::vector<uint8_t>>) {
                return values.empty() ? 0 : 1;
            } else {
                return values.size();
            }
        },
        storage_);
}

auto dicom_value::as_string() const -> Result<std::string> {
    const auto* strings = std::get_if<std::vector<std::string>>(&storage_);
    if (strings == nullptr) {
        return make_stream_error<std::string>(error_codes::value_conversion_error,
                                              "Value is not text");
    }
    if (strings->empty()) {
        return Result<std::string>::ok(std::string{});
    }
    return Result<std::string>::ok(strings->front());
}

auto dicom_value::as_strings() const -> Result<std::vector<std::string>> {
    const auto* strings = std::get_if<std::vector<std::string>>(&storage_);
    if (strings == nullptr) {
        return make_stream_error<std::vector<std::string>>(error_codes::value_conversion_error,
                                                           "Value is not text");
    }
    return Result<std::vector<std::string>>::ok(*strings);
}

auto dicom_value::as_tags() const -> Result<std::vector<dicom_tag>> {
    const auto* tags = std::get_if<std::vector<dicom_tag>>(&storage_);
    if (tags == nullptr) {
        return make_stream_error<std::vector<dicom_tag>>(error_codes::value_conversion_error,
                                                         "Value is not an attribute tag list");
    }
    return Result<std::vector<dicom_tag>>::ok(*tags);
}

auto dicom_value::raw_bytes() const noexcept -> std::span<const uint8_t> {
    if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&storage_)) {
        return *bytes;
    }
    return {};
}

auto dicom_value::to_string() const -> std::string {
    return std::visit(
        [](const auto& values) -> std::string {
            using V = std::decay_t<decltype(values)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<V, std::vector<uint8_t>>) {
                return compat::format("<{} bytes>", values.size());
            } else {
                std::string out;
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (i > 0) {
                        out += '\\';
                    }
                    if constexpr (std::is_same_v<V, std::vector<std::string>>) {
                        out += values[i];
                    } else if constexpr (std::is_same_v<V, std::vector<dicom_tag>>) {
                        out += values[i].to_string();
                    } else {
                        out += compat::format("{}", values[i]);
                    }
                }
                return out;
            }
        },
        storage_);
}

}  // namespace dcmstream::core
