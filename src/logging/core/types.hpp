/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef FACET_LOGGING_TYPES_HPP
#define FACET_LOGGING_TYPES_HPP

#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace facet::logging {

/**
 * @brief Ordered record severity
 *
 * The numeric values are part of the contract: Logger::v(n) gates on the
 * severity whose value is n, so any integer in range is a valid severity.
 */
enum class Severity : std::int8_t {
    Debug = -1,
    Info = 0,
    Warn = 1,
    Error = 2,
    DPanic = 3,
    Panic = 4,
    Fatal = 5
};

inline constexpr Severity MIN_SEVERITY = Severity::Debug;
inline constexpr Severity MAX_SEVERITY = Severity::Fatal;

/**
 * @brief Parse a severity name
 *
 * Accepts the lower- or upper-case names ("debug", "INFO", ...). The empty
 * string selects info.
 *
 * @return Parsed severity, or nullopt for an unrecognized name
 */
[[nodiscard]] auto parseSeverity(std::string_view text)
    -> std::optional<Severity>;

/**
 * @brief Lower-case severity name ("info"), or "Level(n)" when out of range
 */
[[nodiscard]] auto severityToString(Severity severity) -> std::string;

/**
 * @brief Upper-case severity name ("INFO"), or "LEVEL(n)" when out of range
 */
[[nodiscard]] auto severityToCapitalString(Severity severity) -> std::string;

/**
 * @brief Severity for a raw verbosity value
 */
[[nodiscard]] constexpr auto severityFromInt(int value) noexcept -> Severity {
    if (value < INT8_MIN) {
        value = INT8_MIN;
    } else if (value > INT8_MAX) {
        value = INT8_MAX;
    }
    return static_cast<Severity>(value);
}

[[nodiscard]] constexpr auto toInt(Severity severity) noexcept -> int {
    return static_cast<int>(severity);
}

/**
 * @brief Convert severity to the closest spdlog level
 */
[[nodiscard]] auto toSpdlogLevel(Severity severity) noexcept
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level to severity (trace folds into debug,
 * critical into error)
 */
[[nodiscard]] auto fromSpdlogLevel(spdlog::level::level_enum level) noexcept
    -> Severity;

/**
 * @brief Source location of a logging call
 *
 * Unlike std::source_location this can be built from locations reported by
 * other logging front ends (spdlog::source_loc).
 */
struct Caller {
    const char* file{nullptr};
    int line{0};
    const char* function{nullptr};

    [[nodiscard]] static auto from(const std::source_location& location) noexcept
        -> Caller;
    [[nodiscard]] static auto from(const spdlog::source_loc& location) noexcept
        -> Caller;

    [[nodiscard]] auto defined() const noexcept -> bool {
        return file != nullptr && *file != '\0';
    }

    /**
     * @brief Short form "dir/file.cpp:42"
     */
    [[nodiscard]] auto toShortString() const -> std::string;
};

/**
 * @brief Log message text together with the location it was issued from
 *
 * Converting constructors capture the call site, so every facade method that
 * takes a Message records its caller without macros.
 */
class Message {
public:
    Message(const char* text,
            std::source_location location = std::source_location::current())
        : text_(text != nullptr ? text : ""), caller_(Caller::from(location)) {}

    Message(std::string_view text,
            std::source_location location = std::source_location::current())
        : text_(text), caller_(Caller::from(location)) {}

    Message(const std::string& text,
            std::source_location location = std::source_location::current())
        : text_(text), caller_(Caller::from(location)) {}

    Message(std::string_view text, Caller caller)
        : text_(text), caller_(caller) {}

    [[nodiscard]] auto text() const noexcept -> std::string_view {
        return text_;
    }
    [[nodiscard]] auto caller() const noexcept -> const Caller& {
        return caller_;
    }

private:
    std::string_view text_;
    Caller caller_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_TYPES_HPP
