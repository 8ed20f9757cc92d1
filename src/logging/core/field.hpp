/*
 * field.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Structured fields and key/value argument conversion

**************************************************/

#ifndef FACET_LOGGING_FIELD_HPP
#define FACET_LOGGING_FIELD_HPP

#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace facet::logging {

/**
 * @brief Typed key/value pair attached to a record
 *
 * The value is any JSON value: string, number, bool, null, array or object.
 */
struct Field {
    std::string key;
    nlohmann::json value;

    bool operator==(const Field& other) const = default;
};

using Fields = std::vector<Field>;

namespace field {

/**
 * @brief Field from any value with a JSON conversion (to_json / adl_serializer)
 */
template <typename T>
[[nodiscard]] auto any(std::string key, T&& value) -> Field {
    return Field{std::move(key), nlohmann::json(std::forward<T>(value))};
}

[[nodiscard]] auto string(std::string key, std::string_view value) -> Field;

/**
 * @brief "error" field carrying the exception message
 */
[[nodiscard]] auto error(const std::exception& e) -> Field;

[[nodiscard]] auto namedError(std::string key, const std::exception& e)
    -> Field;

}  // namespace field

/**
 * @brief One element of an alternating key/value argument list
 *
 * Holds either a raw JSON value (a key or a value) or a typed Field passed
 * where a raw key/value was expected.
 */
class KeyValue {
public:
    KeyValue(Field field) : value_(std::move(field)) {}

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, Field> &&
                 !std::is_same_v<std::remove_cvref_t<T>, KeyValue> &&
                 std::is_constructible_v<nlohmann::json, T>)
    KeyValue(T&& value)
        : value_(std::in_place_type<nlohmann::json>, std::forward<T>(value)) {}

    [[nodiscard]] auto isField() const noexcept -> bool {
        return std::holds_alternative<Field>(value_);
    }
    [[nodiscard]] auto field() const -> const Field& {
        return std::get<Field>(value_);
    }
    [[nodiscard]] auto json() const -> const nlohmann::json& {
        return std::get<nlohmann::json>(value_);
    }

private:
    std::variant<Field, nlohmann::json> value_;
};

using KeyValues = std::vector<KeyValue>;

/**
 * @brief Description of a malformed key/value argument list
 */
struct KeyValueDiagnostic {
    std::string message;
    Field detail;
};

struct KeyValueConversion {
    Fields fields;
    std::optional<KeyValueDiagnostic> diagnostic;
};

/**
 * @brief Convert alternating key/value arguments to fields
 *
 * Conversion stops at the first typed field in key position, dangling key or
 * non-string key; the pairs gathered so far are kept and the problem is
 * described in the returned diagnostic. @p additional is appended after the
 * converted pairs unconditionally. Never throws on malformed input.
 */
[[nodiscard]] auto convertKeyValues(std::span<const KeyValue> args,
                                    const Fields& additional = {})
    -> KeyValueConversion;

}  // namespace facet::logging

#endif  // FACET_LOGGING_FIELD_HPP
