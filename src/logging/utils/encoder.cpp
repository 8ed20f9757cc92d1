/*
 * encoder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "encoder.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace facet::logging {

namespace {

constexpr std::string_view COLOR_RESET = "\033[0m";

auto levelColor(Severity severity) -> std::string_view {
    switch (severity) {
        case Severity::Debug:
            return "\033[35m";  // Magenta
        case Severity::Info:
            return "\033[34m";  // Blue
        case Severity::Warn:
            return "\033[33m";  // Yellow
        default:
            return "\033[31m";  // Red
    }
}

void appendKey(std::string& out, std::string_view key) {
    out += dumpJson(nlohmann::json(std::string(key)));
    out += ':';
}

void appendMember(std::string& out, std::string_view key,
                  std::string_view value) {
    out += ',';
    appendKey(out, key);
    out += dumpJson(nlohmann::json(std::string(value)));
}

}  // namespace

// ============================================================================
// Encoder
// ============================================================================

auto Encoder::create(std::string_view format, bool color)
    -> std::unique_ptr<Encoder> {
    std::string lowered(format);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "console") {
        return std::make_unique<ConsoleEncoder>(color);
    }
    if (lowered == "json") {
        return std::make_unique<JsonEncoder>();
    }
    return nullptr;
}

auto Encoder::formatTimestamp(const std::chrono::system_clock::time_point& tp)
    -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) %
              1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// ============================================================================
// ConsoleEncoder
// ============================================================================

auto ConsoleEncoder::encodeLevel(Severity severity) const -> std::string {
    if (!color_) {
        return severityToCapitalString(severity);
    }

    std::string result(levelColor(severity));
    result += severityToCapitalString(severity);
    result += COLOR_RESET;
    return result;
}

auto ConsoleEncoder::encode(const Entry& entry) const -> std::string {
    std::string line = formatTimestamp(entry.timestamp);

    line += '\t';
    line += encodeLevel(entry.severity);

    if (!entry.loggerName.empty()) {
        line += '\t';
        line += entry.loggerName;
    }
    if (entry.caller.defined()) {
        line += '\t';
        line += entry.caller.toShortString();
    }

    // The message is always present, even when empty
    line += '\t';
    line += entry.message;

    if (!entry.context.empty() || !entry.fields.empty()) {
        line += "\t{";
        appendFields(line, entry.context, false);
        appendFields(line, entry.fields, !entry.context.empty());
        line += '}';
    }

    if (!entry.stacktrace.empty()) {
        line += '\n';
        line += entry.stacktrace;
    }

    return line;
}

// ============================================================================
// JsonEncoder
// ============================================================================

auto JsonEncoder::encode(const Entry& entry) const -> std::string {
    std::string line = "{";
    appendKey(line, EncoderKeys::LEVEL);
    line += dumpJson(nlohmann::json(severityToCapitalString(entry.severity)));

    appendMember(line, EncoderKeys::TIME, formatTimestamp(entry.timestamp));

    if (!entry.loggerName.empty()) {
        appendMember(line, EncoderKeys::NAME, entry.loggerName);
    }
    if (entry.caller.defined()) {
        appendMember(line, EncoderKeys::CALLER, entry.caller.toShortString());
    }

    appendMember(line, EncoderKeys::MESSAGE, entry.message);

    appendFields(line, entry.context, true);
    appendFields(line, entry.fields, true);

    if (!entry.stacktrace.empty()) {
        appendMember(line, EncoderKeys::STACKTRACE, entry.stacktrace);
    }

    line += '}';
    return line;
}

// ============================================================================
// Helpers
// ============================================================================

void appendFields(std::string& out, std::span<const Field> fields,
                  bool leadingComma) {
    bool comma = leadingComma;
    for (const auto& field : fields) {
        if (comma) {
            out += ',';
        }
        appendKey(out, field.key);
        out += dumpJson(field.value);
        comma = true;
    }
}

auto dumpJson(const nlohmann::json& value) -> std::string {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace facet::logging
