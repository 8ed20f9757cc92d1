/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "context.hpp"

#include <utility>

namespace facet::logging {

auto Context::withValue(std::string key, nlohmann::json value) const
    -> Context {
    return Context(std::make_shared<const Node>(
        Node{std::move(key), std::move(value), head_}));
}

auto Context::value(std::string_view key) const
    -> std::optional<nlohmann::json> {
    for (const Node* node = head_.get(); node != nullptr;
         node = node->parent.get()) {
        if (node->key == key) {
            if (node->value.is_null()) {
                return std::nullopt;
            }
            return node->value;
        }
    }
    return std::nullopt;
}

}  // namespace facet::logging
