/**
 * @file dicom_value.hpp
 * @brief Materialized value of a data element
 *
 * A dicom_value is what the eager element stream attaches to every element
 * it produces. Text is already converted to UTF-8 with padding removed,
 * binary numbers are in host representation, and opaque byte VRs keep
 * their bytes (word-sized VRs normalized to little-endian order).
 */

#pragma once

#include "dcmstream/core/dicom_tag.hpp"
#include "dcmstream/core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace dcmstream::core {

class dicom_value {
public:
    using storage_type = std::variant<std::monostate,
                                      std::vector<std::string>,
                                      std::vector<dicom_tag>,
                                      std::vector<uint16_t>,
                                      std::vector<int16_t>,
                                      std::vector<uint32_t>,
                                      std::vector<int32_t>,
                                      std::vector<uint64_t>,
                                      std::vector<int64_t>,
                                      std::vector<float>,
                                      std::vector<double>,
                                      std::vector<uint8_t>>;

    /**
     * @brief The empty value (structural markers, sequences, zero length)
     */
    dicom_value() = default;

    [[nodiscard]] static auto from_strings(std::vector<std::string> values) -> dicom_value {
        return dicom_value{storage_type{std::move(values)}};
    }

    [[nodiscard]] static auto from_tags(std::vector<dicom_tag> values) -> dicom_value {
        return dicom_value{storage_type{std::move(values)}};
    }

    [[nodiscard]] static auto from_bytes(std::vector<uint8_t> bytes) -> dicom_value {
        return dicom_value{storage_type{std::move(bytes)}};
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numbers(std::vector<T> values) -> dicom_value {
        return dicom_value{storage_type{std::move(values)}};
    }

    [[nodiscard]] auto is_empty() const noexcept -> bool;

    /**
     * @brief Number of values; opaque bytes count as a single value
     */
    [[nodiscard]] auto multiplicity() const noexcept -> std::size_t;

    [[nodiscard]] auto is_text() const noexcept -> bool {
        return std::holds_alternative<std::vector<std::string>>(storage_);
    }

    [[nodiscard]] auto is_bytes() const noexcept -> bool {
        return std::holds_alternative<std::vector<uint8_t>>(storage_);
    }

    /**
     * @brief First text value
     */
    [[nodiscard]] auto as_string() const -> Result<std::string>;

    [[nodiscard]] auto as_strings() const -> Result<std::vector<std::string>>;

    [[nodiscard]] auto as_tags() const -> Result<std::vector<dicom_tag>>;

    /**
     * @brief First numeric value converted to T
     *
     * Any binary numeric value converts; text values do not (use
     * as_string() and parse IS/DS explicitly).
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric() const -> Result<T> {
        auto all = as_numbers<T>();
        if (all.is_err()) {
            return forward_error<T>(all);
        }
        if (all.value().empty()) {
            return make_stream_error<T>(error_codes::value_conversion_error,
                                        "Numeric value is empty");
        }
        return Result<T>::ok(all.value().front());
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numbers() const -> Result<std::vector<T>> {
        return std::visit(
            [](const auto& values) -> Result<std::vector<T>> {
                using V = typename std::decay_t<decltype(values)>;
                if constexpr (std::is_same_v<V, std::monostate> ||
                              std::is_same_v<V, std::vector<std::string>> ||
                              std::is_same_v<V, std::vector<dicom_tag>> ||
                              std::is_same_v<V, std::vector<uint8_t>>) {
                    return make_stream_error<std::vector<T>>(
                        error_codes::value_conversion_error, "Value is not numeric");
                } else {
                    std::vector<T> converted;
                    converted.reserve(values.size());
                    for (const auto v : values) {
                        converted.push_back(static_cast<T>(v));
                    }
                    return Result<std::vector<T>>::ok(std::move(converted));
                }
            },
            storage_);
    }

    /**
     * @brief Raw bytes of an opaque value, empty for any other kind
     */
    [[nodiscard]] auto raw_bytes() const noexcept -> std::span<const uint8_t>;

    [[nodiscard]] auto storage() const noexcept -> const storage_type& { return storage_; }

    /**
     * @brief Display form: values joined with '\', bytes summarized by size
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const dicom_value& other) const -> bool = default;

private:
    explicit dicom_value(storage_type storage) : storage_{std::move(storage)} {}

    storage_type storage_;
};

}  // namespace dcmstream::core
