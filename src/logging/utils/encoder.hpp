/*
 * encoder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Record encoders for console and JSON output

**************************************************/

#ifndef FACET_LOGGING_ENCODER_HPP
#define FACET_LOGGING_ENCODER_HPP

#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "../core/field.hpp"
#include "../core/types.hpp"

namespace facet::logging {

/**
 * @brief One record, as handed to an encoder
 *
 * Views into the caller's data; valid for the duration of encode().
 */
struct Entry {
    std::chrono::system_clock::time_point timestamp;
    Severity severity{Severity::Info};
    std::string_view loggerName;
    Caller caller;  ///< Undefined when caller capture is disabled
    std::string_view message;
    std::span<const Field> context;  ///< Bound fields of the logger
    std::span<const Field> fields;   ///< Fields of this call
    std::string_view stacktrace;
};

/**
 * @brief Key names used by the encoders
 */
struct EncoderKeys {
    static constexpr std::string_view MESSAGE = "message";
    static constexpr std::string_view LEVEL = "level";
    static constexpr std::string_view TIME = "timestamp";
    static constexpr std::string_view NAME = "logger";
    static constexpr std::string_view CALLER = "caller";
    static constexpr std::string_view STACKTRACE = "stacktrace";
};

/**
 * @brief Turns an entry into one line of text (without line ending)
 */
class Encoder {
public:
    virtual ~Encoder() = default;

    [[nodiscard]] virtual auto encode(const Entry& entry) const
        -> std::string = 0;

    /**
     * @brief Create an encoder for a format name ("console" or "json",
     * case-insensitive)
     * @return Encoder, or nullptr for an unknown format
     */
    [[nodiscard]] static auto create(std::string_view format, bool color)
        -> std::unique_ptr<Encoder>;

    /**
     * @brief "YYYY-MM-DD HH:MM:SS.mmm" in local time
     */
    [[nodiscard]] static auto formatTimestamp(
        const std::chrono::system_clock::time_point& tp) -> std::string;
};

/**
 * @brief Tab-separated human readable records
 *
 * timestamp, level, logger, caller, message, then the fields as a JSON
 * object. Empty elements are left out; a stacktrace follows on its own lines.
 */
class ConsoleEncoder final : public Encoder {
public:
    explicit ConsoleEncoder(bool color = false) : color_(color) {}

    [[nodiscard]] auto encode(const Entry& entry) const -> std::string override;

private:
    [[nodiscard]] auto encodeLevel(Severity severity) const -> std::string;

    bool color_;
};

/**
 * @brief One JSON object per record
 */
class JsonEncoder final : public Encoder {
public:
    [[nodiscard]] auto encode(const Entry& entry) const -> std::string override;
};

/**
 * @brief Append fields to @p out as JSON members ("k":v,...) in order,
 * keeping duplicate keys
 */
void appendFields(std::string& out, std::span<const Field> fields,
                  bool leadingComma);

/**
 * @brief JSON text of a value; invalid UTF-8 is replaced, never thrown
 */
[[nodiscard]] auto dumpJson(const nlohmann::json& value) -> std::string;

}  // namespace facet::logging

#endif  // FACET_LOGGING_ENCODER_HPP
