/*
 * field.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "field.hpp"

namespace facet::logging {

namespace field {

auto string(std::string key, std::string_view value) -> Field {
    return Field{std::move(key), nlohmann::json(std::string(value))};
}

auto error(const std::exception& e) -> Field {
    return namedError("error", e);
}

auto namedError(std::string key, const std::exception& e) -> Field {
    return Field{std::move(key), nlohmann::json(std::string(e.what()))};
}

}  // namespace field

auto convertKeyValues(std::span<const KeyValue> args, const Fields& additional)
    -> KeyValueConversion {
    KeyValueConversion result;
    if (args.empty()) {
        result.fields = additional;
        return result;
    }

    result.fields.reserve(args.size() / 2 + additional.size());

    for (std::size_t i = 0; i < args.size();) {
        if (args[i].isField()) {
            const auto& typed = args[i].field();
            result.diagnostic = KeyValueDiagnostic{
                "strongly-typed field passed as a key-value argument",
                Field{"field", nlohmann::json{{typed.key, typed.value}}}};
            break;
        }

        if (i == args.size() - 1) {
            result.diagnostic = KeyValueDiagnostic{
                "odd number of arguments passed as key-value pairs for "
                "logging",
                Field{"ignored key", args[i].json()}};
            break;
        }

        const auto& key = args[i].json();
        if (!key.is_string()) {
            result.diagnostic = KeyValueDiagnostic{
                "non-string key argument passed to logging, ignoring all "
                "later arguments",
                Field{"invalid key", key}};
            break;
        }

        const auto& value = args[i + 1];
        if (value.isField()) {
            result.fields.push_back(Field{
                key.get<std::string>(),
                nlohmann::json{{value.field().key, value.field().value}}});
        } else {
            result.fields.push_back(Field{key.get<std::string>(), value.json()});
        }
        i += 2;
    }

    result.fields.insert(result.fields.end(), additional.begin(),
                         additional.end());
    return result;
}

}  // namespace facet::logging
