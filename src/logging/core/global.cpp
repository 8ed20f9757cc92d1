/*
 * global.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "global.hpp"

#include <mutex>
#include <shared_mutex>

#include "../sinks/redirect_sink.hpp"
#include "../utils/log_stream.hpp"

namespace facet::logging {

namespace {

struct DefaultState {
    std::shared_mutex mutex;
    std::shared_ptr<const Logger> logger;
};

auto state() -> DefaultState& {
    static DefaultState instance;
    return instance;
}

}  // namespace

void init(const Options& options) {
    auto logger = Logger::create(options);
    replaceDefault(logger);
    redirectAmbientLogging(logger);
}

void replaceDefault(Logger logger) {
    auto replacement = std::make_shared<const Logger>(std::move(logger));
    auto& current = state();
    std::unique_lock lock(current.mutex);
    current.logger.swap(replacement);
}

auto defaultLogger() -> std::shared_ptr<const Logger> {
    auto& current = state();
    {
        std::shared_lock lock(current.mutex);
        if (current.logger) {
            return current.logger;
        }
    }

    std::unique_lock lock(current.mutex);
    if (!current.logger) {
        current.logger = std::make_shared<const Logger>(
            Logger::create(Options::createDefault()));
        redirectAmbientLogging(*current.logger);
    }
    return current.logger;
}

void debug(Message message, const Fields& fields) {
    defaultLogger()->debug(std::move(message), fields);
}

void info(Message message, const Fields& fields) {
    defaultLogger()->info(std::move(message), fields);
}

void warn(Message message, const Fields& fields) {
    defaultLogger()->warn(std::move(message), fields);
}

void error(Message message, const Fields& fields) {
    defaultLogger()->error(std::move(message), fields);
}

void dpanic(Message message, const Fields& fields) {
    defaultLogger()->dpanic(std::move(message), fields);
}

void panic(Message message, const Fields& fields) {
    defaultLogger()->panic(std::move(message), fields);
}

void fatal(Message message, const Fields& fields) {
    defaultLogger()->fatal(std::move(message), fields);
}

void log(Severity severity, Message message, const Fields& fields) {
    defaultLogger()->log(severity, std::move(message), fields);
}

auto v(int level) -> std::shared_ptr<const InfoLogger> {
    return defaultLogger()->v(level);
}

auto withFields(const Fields& fields) -> Logger {
    return defaultLogger()->withFields(fields);
}

auto withName(std::string_view name) -> Logger {
    return defaultLogger()->withName(name);
}

auto fromContext(const Context& context) -> Logger {
    return defaultLogger()->fromContext(context);
}

auto write(std::string_view bytes, std::source_location location)
    -> std::size_t {
    return defaultLogger()->write(bytes, location);
}

void flush() { defaultLogger()->flush(); }

auto level() -> Severity { return defaultLogger()->level(); }

void setLevel(Severity severity) { defaultLogger()->setLevel(severity); }

auto stdInfoStream() -> std::ostream& {
    // The default state must outlive the stream, which flushes on exit
    state();
    static LogStream stream(defaultLogger, Severity::Info);
    return stream;
}

auto stdErrorStream() -> std::ostream& {
    state();
    static LogStream stream(defaultLogger, Severity::Error);
    return stream;
}

}  // namespace facet::logging
