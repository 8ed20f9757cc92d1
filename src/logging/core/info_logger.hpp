/*
 * info_logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Level-gated info logger returned by Logger::v()

**************************************************/

#ifndef FACET_LOGGING_INFO_LOGGER_HPP
#define FACET_LOGGING_INFO_LOGGER_HPP

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/printf.h>

#include "field.hpp"
#include "types.hpp"

namespace facet::logging {

namespace detail {

/**
 * @brief printf-style formatting that never throws on a bad format
 *
 * Without arguments the format is used verbatim. A malformed format yields
 * the raw format followed by a note describing the problem.
 */
template <typename... Args>
[[nodiscard]] auto sprintfMessage(std::string_view format, const Args&... args)
    -> std::string {
    if constexpr (sizeof...(Args) == 0) {
        return std::string(format);
    } else {
        try {
            return fmt::sprintf(format, args...);
        } catch (const fmt::format_error& e) {
            return std::string(format) + " (format error: " + e.what() + ")";
        }
    }
}

}  // namespace detail

/**
 * @brief Minimal logging capability at one fixed severity
 *
 * All emission methods check enabled() first, so a disabled logger does no
 * formatting, conversion or allocation.
 */
class InfoLogger {
public:
    virtual ~InfoLogger() = default;

    [[nodiscard]] virtual auto enabled() const noexcept -> bool = 0;

    void info(Message message, const Fields& fields = {}) const {
        if (!enabled()) {
            return;
        }
        emit(message, fields);
    }

    template <typename... Args>
    void infof(Message format, const Args&... args) const {
        if (!enabled()) {
            return;
        }
        auto text = detail::sprintfMessage(format.text(), args...);
        emit(Message(text, format.caller()), {});
    }

    template <typename... KV>
    void infow(Message message, KV&&... keyValues) const {
        if (!enabled()) {
            return;
        }
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        emitKeyValues(message, args);
    }

protected:
    virtual void emit(const Message& message,
                      std::span<const Field> fields) const = 0;
    virtual void emitKeyValues(const Message& message,
                               std::span<const KeyValue> args) const = 0;
};

/**
 * @brief Info logger that never emits
 */
class NoopInfoLogger final : public InfoLogger {
public:
    [[nodiscard]] auto enabled() const noexcept -> bool override {
        return false;
    }

protected:
    void emit(const Message&, std::span<const Field>) const override {}
    void emitKeyValues(const Message&,
                       std::span<const KeyValue>) const override {}
};

/**
 * @brief The shared disabled logger
 *
 * Every call returns a handle to the same object and allocates nothing.
 */
[[nodiscard]] auto disabledInfoLogger() noexcept
    -> std::shared_ptr<const InfoLogger>;

}  // namespace facet::logging

#endif  // FACET_LOGGING_INFO_LOGGER_HPP
