/*
 * engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine.hpp"

#include <chrono>
#include <string>

#include "../sinks/sink_factory.hpp"
#include "../utils/stacktrace.hpp"
#include "exceptions.hpp"

namespace facet::logging {

Engine::Engine(const Options& options)
    : level_(toInt(parseSeverity(options.level).value_or(Severity::Info))),
      captureCaller_(!options.disableCaller),
      captureStacktrace_(!options.disableStacktrace),
      development_(options.development),
      encoder_(Encoder::create(options.format, options.enableColor)) {
    if (!encoder_) {
        throw BuildError("no encoder registered for name \"" + options.format +
                         "\"");
    }

    if (options.sampling) {
        sampler_ = std::make_unique<Sampler>(options.sampling->initial,
                                             options.sampling->thereafter);
    }

    auto errorSinks = SinkFactory::createSinks(options.errorOutputPaths);
    errorOutput_ = std::make_shared<spdlog::logger>(
        "facet.errors", errorSinks.begin(), errorSinks.end());
    errorOutput_->set_level(spdlog::level::trace);

    auto sinks = SinkFactory::createSinks(options.outputPaths);
    output_ =
        std::make_shared<spdlog::logger>("facet", sinks.begin(), sinks.end());
    output_->set_level(spdlog::level::trace);
    output_->set_error_handler(
        [this](const std::string& message) { reportError(message); });
}

void Engine::write(Severity severity, std::string_view loggerName,
                   const Caller& caller, std::string_view message,
                   std::span<const Field> context,
                   std::span<const Field> fields) {
    auto now = std::chrono::system_clock::now();
    if (sampler_ && !sampler_->check(severity, message, now)) {
        return;
    }

    std::string stacktrace;
    if (captureStacktrace_ && severity >= stacktraceLevel_) {
        stacktrace = captureStacktrace(1);
    }

    Entry entry{now,
                severity,
                loggerName,
                captureCaller_ ? caller : Caller{},
                message,
                context,
                fields,
                stacktrace};

    std::string line;
    try {
        line = encoder_->encode(entry);
    } catch (const std::exception& e) {
        reportError(std::string("failed to encode record: ") + e.what());
        return;
    }

    output_->log(spdlog::source_loc{}, toSpdlogLevel(severity),
                 spdlog::string_view_t(line.data(), line.size()));
}

void Engine::flush() {
    output_->flush();
    errorOutput_->flush();
}

void Engine::reportError(std::string_view message) {
    auto line = Encoder::formatTimestamp(std::chrono::system_clock::now()) +
                " write error: " + std::string(message);
    errorOutput_->log(spdlog::source_loc{}, spdlog::level::err,
                      spdlog::string_view_t(line.data(), line.size()));
    errorOutput_->flush();
}

}  // namespace facet::logging
