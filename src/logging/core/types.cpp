/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <string_view>

namespace facet::logging {

// ============================================================================
// Severity
// ============================================================================

auto parseSeverity(std::string_view text) -> std::optional<Severity> {
    if (text == "debug" || text == "DEBUG") {
        return Severity::Debug;
    }
    if (text == "info" || text == "INFO" || text.empty()) {
        return Severity::Info;
    }
    if (text == "warn" || text == "WARN") {
        return Severity::Warn;
    }
    if (text == "error" || text == "ERROR") {
        return Severity::Error;
    }
    if (text == "dpanic" || text == "DPANIC") {
        return Severity::DPanic;
    }
    if (text == "panic" || text == "PANIC") {
        return Severity::Panic;
    }
    if (text == "fatal" || text == "FATAL") {
        return Severity::Fatal;
    }
    return std::nullopt;
}

auto severityToString(Severity severity) -> std::string {
    switch (severity) {
        case Severity::Debug:
            return "debug";
        case Severity::Info:
            return "info";
        case Severity::Warn:
            return "warn";
        case Severity::Error:
            return "error";
        case Severity::DPanic:
            return "dpanic";
        case Severity::Panic:
            return "panic";
        case Severity::Fatal:
            return "fatal";
    }
    return "Level(" + std::to_string(toInt(severity)) + ")";
}

auto severityToCapitalString(Severity severity) -> std::string {
    switch (severity) {
        case Severity::Debug:
            return "DEBUG";
        case Severity::Info:
            return "INFO";
        case Severity::Warn:
            return "WARN";
        case Severity::Error:
            return "ERROR";
        case Severity::DPanic:
            return "DPANIC";
        case Severity::Panic:
            return "PANIC";
        case Severity::Fatal:
            return "FATAL";
    }
    return "LEVEL(" + std::to_string(toInt(severity)) + ")";
}

auto toSpdlogLevel(Severity severity) noexcept -> spdlog::level::level_enum {
    if (severity < Severity::Debug) {
        return spdlog::level::trace;
    }
    switch (severity) {
        case Severity::Debug:
            return spdlog::level::debug;
        case Severity::Info:
            return spdlog::level::info;
        case Severity::Warn:
            return spdlog::level::warn;
        case Severity::Error:
            return spdlog::level::err;
        default:
            return spdlog::level::critical;
    }
}

auto fromSpdlogLevel(spdlog::level::level_enum level) noexcept -> Severity {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug:
            return Severity::Debug;
        case spdlog::level::info:
            return Severity::Info;
        case spdlog::level::warn:
            return Severity::Warn;
        default:
            return Severity::Error;
    }
}

// ============================================================================
// Caller
// ============================================================================

auto Caller::from(const std::source_location& location) noexcept -> Caller {
    return Caller{location.file_name(), static_cast<int>(location.line()),
                  location.function_name()};
}

auto Caller::from(const spdlog::source_loc& location) noexcept -> Caller {
    return Caller{location.filename, location.line, location.funcname};
}

auto Caller::toShortString() const -> std::string {
    if (!defined()) {
        return "undefined";
    }

    // Keep the last directory and the file name: "logging/logger.cpp:42"
    std::string_view path(file);
    auto last = path.find_last_of("/\\");
    if (last != std::string_view::npos && last > 0) {
        auto previous = path.find_last_of("/\\", last - 1);
        if (previous != std::string_view::npos) {
            path.remove_prefix(previous + 1);
        }
    }

    std::string result(path);
    result += ':';
    result += std::to_string(line);
    return result;
}

}  // namespace facet::logging
