/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logger options: sinks, level, format and presentation flags

**************************************************/

#ifndef FACET_LOGGING_OPTIONS_HPP
#define FACET_LOGGING_OPTIONS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace facet::logging {

using json = nlohmann::json;

/**
 * @brief Validation result with detailed error information
 */
struct ValidationResult {
    bool isValid = true;              ///< Whether validation passed
    std::vector<std::string> errors;  ///< Validation errors, in check order

    void addError(std::string error) {
        isValid = false;
        errors.emplace_back(std::move(error));
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }

    /**
     * @brief All errors in one line: "[first second]"
     */
    [[nodiscard]] std::string getErrorMessage() const;
};

/**
 * @brief Record sampling: per second, the first @c initial records with the
 * same severity and message pass, then every @c thereafter-th
 */
struct SamplingOptions {
    int initial{100};
    int thereafter{100};

    [[nodiscard]] json toJson() const {
        return {{"initial", initial}, {"thereafter", thereafter}};
    }

    [[nodiscard]] static SamplingOptions fromJson(const json& j) {
        SamplingOptions cfg;
        cfg.initial = j.value("initial", cfg.initial);
        cfg.thereafter = j.value("thereafter", cfg.thereafter);
        return cfg;
    }

    bool operator==(const SamplingOptions&) const = default;
};

/**
 * @brief Logger configuration
 *
 * @example
 * ```json
 * {
 *   "output-paths": ["stdout", "/var/log/app.log"],
 *   "error-output-paths": ["stderr"],
 *   "level": "debug",
 *   "format": "json",
 *   "disable-caller": false,
 *   "disable-stacktrace": false,
 *   "enable-color": false,
 *   "development": false,
 *   "name": "apiserver",
 *   "sampling": {"initial": 100, "thereafter": 100}
 * }
 * ```
 */
struct Options {
    static constexpr std::string_view CONSOLE_FORMAT = "console";
    static constexpr std::string_view JSON_FORMAT = "json";

    /// Record destinations: "stdout", "stderr" or file paths
    std::vector<std::string> outputPaths{"stdout"};
    /// Destinations for internal errors of the logger itself
    std::vector<std::string> errorOutputPaths{"stderr"};
    std::string level{"info"};
    std::string format{std::string(CONSOLE_FORMAT)};
    bool disableCaller{false};
    bool disableStacktrace{false};
    bool enableColor{false};  ///< ANSI level colors, console format only
    bool development{false};  ///< dpanic escalates like panic
    std::string name;         ///< Root logger name
    std::optional<SamplingOptions> sampling{SamplingOptions{}};

    /**
     * @brief Options with default values (stdout, stderr, info, console)
     */
    [[nodiscard]] static Options createDefault();

    /**
     * @brief Check the level and the format
     *
     * Both checks always run, so an invalid level and an invalid format are
     * reported together, level first.
     */
    [[nodiscard]] ValidationResult validate() const;

    /**
     * @brief Construct a logger from these options, install it as the process
     * default and redirect spdlog's default logger into it
     *
     * An unrecognized level falls back to info.
     *
     * @throws BuildError if a sink cannot be opened or the format is unknown
     */
    void build() const;

    // ========================================================================
    // Serialization
    // ========================================================================

    [[nodiscard]] json serialize() const;
    [[nodiscard]] static Options deserialize(const json& j);
    [[nodiscard]] static json generateSchema();

    [[nodiscard]] json toJson() const { return serialize(); }
    [[nodiscard]] static Options fromJson(const json& j) {
        return deserialize(j);
    }

    /**
     * @brief Compact JSON form, for printing the active configuration
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Read options from a JSON document
     * @throws ConfigError if the file cannot be read or parsed
     */
    [[nodiscard]] static Options loadFromFile(const std::string& path);

    bool operator==(const Options&) const = default;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_OPTIONS_HPP
