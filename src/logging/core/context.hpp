/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Request-scoped context carrying well-known logging keys

**************************************************/

#ifndef FACET_LOGGING_CONTEXT_HPP
#define FACET_LOGGING_CONTEXT_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace facet::logging {

/// Context key of the request identifier
inline constexpr std::string_view KEY_REQUEST_ID = "requestID";
/// Context key of the authenticated user name
inline constexpr std::string_view KEY_USERNAME = "username";
/// Context key of the watcher name
inline constexpr std::string_view KEY_WATCHER_NAME = "watcher";

/**
 * @brief Immutable key/value context
 *
 * withValue() returns a new context that shares every earlier entry with its
 * parent; the parent is never modified, so contexts can be passed between
 * threads freely. A later value shadows an earlier one with the same key.
 */
class Context {
public:
    Context() = default;

    [[nodiscard]] auto withValue(std::string key, nlohmann::json value) const
        -> Context;

    /**
     * @brief Most recent value stored under @p key
     * @return The value, or nullopt if the key is absent or bound to null
     */
    [[nodiscard]] auto value(std::string_view key) const
        -> std::optional<nlohmann::json>;

    [[nodiscard]] auto empty() const noexcept -> bool { return !head_; }

private:
    struct Node {
        std::string key;
        nlohmann::json value;
        std::shared_ptr<const Node> parent;
    };

    explicit Context(std::shared_ptr<const Node> head)
        : head_(std::move(head)) {}

    std::shared_ptr<const Node> head_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_CONTEXT_HPP
