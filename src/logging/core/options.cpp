/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "exceptions.hpp"
#include "global.hpp"
#include "types.hpp"

namespace facet::logging {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto quotedText(std::string_view text) -> std::string {
    return json(std::string(text)).dump();
}

}  // namespace

std::string ValidationResult::getErrorMessage() const {
    std::string message = "[";
    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            message += ' ';
        }
        message += errors[i];
    }
    message += ']';
    return message;
}

Options Options::createDefault() { return Options{}; }

ValidationResult Options::validate() const {
    ValidationResult result;

    if (!parseSeverity(level)) {
        result.addError("unrecognized level: " + quotedText(level));
    }

    auto lowered = toLower(format);
    if (lowered != CONSOLE_FORMAT && lowered != JSON_FORMAT) {
        result.addError("not a valid log format: " + quotedText(format));
    }

    return result;
}

void Options::build() const { init(*this); }

// ============================================================================
// Serialization
// ============================================================================

json Options::serialize() const {
    return {{"output-paths", outputPaths},
            {"error-output-paths", errorOutputPaths},
            {"level", level},
            {"format", format},
            {"disable-caller", disableCaller},
            {"disable-stacktrace", disableStacktrace},
            {"enable-color", enableColor},
            {"development", development},
            {"name", name},
            {"sampling", sampling ? sampling->toJson() : json(nullptr)}};
}

Options Options::deserialize(const json& j) {
    Options cfg;

    if (j.contains("output-paths") && j["output-paths"].is_array()) {
        cfg.outputPaths = j["output-paths"].get<std::vector<std::string>>();
    }
    if (j.contains("error-output-paths") &&
        j["error-output-paths"].is_array()) {
        cfg.errorOutputPaths =
            j["error-output-paths"].get<std::vector<std::string>>();
    }

    cfg.level = j.value("level", cfg.level);
    cfg.format = j.value("format", cfg.format);
    cfg.disableCaller = j.value("disable-caller", cfg.disableCaller);
    cfg.disableStacktrace =
        j.value("disable-stacktrace", cfg.disableStacktrace);
    cfg.enableColor = j.value("enable-color", cfg.enableColor);
    cfg.development = j.value("development", cfg.development);
    cfg.name = j.value("name", cfg.name);

    if (j.contains("sampling")) {
        const auto& sampling = j["sampling"];
        if (sampling.is_null()) {
            cfg.sampling.reset();
        } else if (sampling.is_object()) {
            cfg.sampling = SamplingOptions::fromJson(sampling);
        }
    }

    return cfg;
}

json Options::generateSchema() {
    return {
        {"type", "object"},
        {"properties",
         {{"output-paths",
           {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"default", {"stdout"}}}},
          {"error-output-paths",
           {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"default", {"stderr"}}}},
          {"level",
           {{"type", "string"},
            {"enum",
             {"debug", "info", "warn", "error", "dpanic", "panic", "fatal"}},
            {"default", "info"}}},
          {"format",
           {{"type", "string"},
            {"enum", {"console", "json"}},
            {"default", "console"}}},
          {"disable-caller", {{"type", "boolean"}, {"default", false}}},
          {"disable-stacktrace", {{"type", "boolean"}, {"default", false}}},
          {"enable-color", {{"type", "boolean"}, {"default", false}}},
          {"development", {{"type", "boolean"}, {"default", false}}},
          {"name", {{"type", "string"}, {"default", ""}}},
          {"sampling",
           {{"type", {"object", "null"}},
            {"properties",
             {{"initial", {{"type", "integer"}, {"minimum", 0}}},
              {"thereafter", {{"type", "integer"}, {"minimum", 0}}}}}}}}}};
}

std::string Options::toString() const { return serialize().dump(); }

Options Options::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open options file: " + path);
    }

    try {
        return deserialize(json::parse(file));
    } catch (const json::exception& e) {
        throw ConfigError("invalid options file '" + path + "': " + e.what());
    }
}

}  // namespace facet::logging
