/*
 * global.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Process-wide default logger and free functions forwarding to it

**************************************************/

#ifndef FACET_LOGGING_GLOBAL_HPP
#define FACET_LOGGING_GLOBAL_HPP

#include <cstddef>
#include <memory>
#include <ostream>
#include <source_location>
#include <string_view>
#include <utility>

#include "context.hpp"
#include "field.hpp"
#include "info_logger.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "types.hpp"

namespace facet::logging {

/**
 * @brief Build a logger from @p options, make it the default and redirect
 * spdlog's default logger into it
 *
 * @throws BuildError if a sink cannot be opened or the format is unknown;
 * the previous default stays in place
 */
void init(const Options& options);

/**
 * @brief Atomically replace the default logger
 *
 * Calls already holding the previous logger finish against it.
 */
void replaceDefault(Logger logger);

/**
 * @brief Snapshot of the current default logger
 *
 * Built from Options::createDefault() on first use, which also redirects
 * spdlog's default logger into it.
 */
[[nodiscard]] auto defaultLogger() -> std::shared_ptr<const Logger>;

// ============================================================================
// Structured
// ============================================================================

void debug(Message message, const Fields& fields = {});
void info(Message message, const Fields& fields = {});
void warn(Message message, const Fields& fields = {});
void error(Message message, const Fields& fields = {});
void dpanic(Message message, const Fields& fields = {});
[[noreturn]] void panic(Message message, const Fields& fields = {});
[[noreturn]] void fatal(Message message, const Fields& fields = {});
void log(Severity severity, Message message, const Fields& fields = {});

// ============================================================================
// printf-style
// ============================================================================

template <typename... Args>
void debugf(Message format, const Args&... args) {
    defaultLogger()->debugf(std::move(format), args...);
}
template <typename... Args>
void infof(Message format, const Args&... args) {
    defaultLogger()->infof(std::move(format), args...);
}
template <typename... Args>
void warnf(Message format, const Args&... args) {
    defaultLogger()->warnf(std::move(format), args...);
}
template <typename... Args>
void errorf(Message format, const Args&... args) {
    defaultLogger()->errorf(std::move(format), args...);
}
template <typename... Args>
void dpanicf(Message format, const Args&... args) {
    defaultLogger()->dpanicf(std::move(format), args...);
}
template <typename... Args>
[[noreturn]] void panicf(Message format, const Args&... args) {
    defaultLogger()->panicf(std::move(format), args...);
}
template <typename... Args>
[[noreturn]] void fatalf(Message format, const Args&... args) {
    defaultLogger()->fatalf(std::move(format), args...);
}

// ============================================================================
// Key/value
// ============================================================================

template <typename... KV>
void debugw(Message message, KV&&... keyValues) {
    defaultLogger()->debugw(std::move(message),
                            std::forward<KV>(keyValues)...);
}
template <typename... KV>
void infow(Message message, KV&&... keyValues) {
    defaultLogger()->infow(std::move(message), std::forward<KV>(keyValues)...);
}
template <typename... KV>
void warnw(Message message, KV&&... keyValues) {
    defaultLogger()->warnw(std::move(message), std::forward<KV>(keyValues)...);
}
template <typename... KV>
void errorw(Message message, KV&&... keyValues) {
    defaultLogger()->errorw(std::move(message),
                            std::forward<KV>(keyValues)...);
}
template <typename... KV>
void dpanicw(Message message, KV&&... keyValues) {
    defaultLogger()->dpanicw(std::move(message),
                             std::forward<KV>(keyValues)...);
}
template <typename... KV>
[[noreturn]] void panicw(Message message, KV&&... keyValues) {
    defaultLogger()->panicw(std::move(message),
                            std::forward<KV>(keyValues)...);
}
template <typename... KV>
[[noreturn]] void fatalw(Message message, KV&&... keyValues) {
    defaultLogger()->fatalw(std::move(message),
                            std::forward<KV>(keyValues)...);
}

// ============================================================================
// Derivation and control
// ============================================================================

[[nodiscard]] auto v(int level) -> std::shared_ptr<const InfoLogger>;

template <typename... KV>
[[nodiscard]] auto withValues(KV&&... keyValues) -> Logger {
    return defaultLogger()->withValues(std::forward<KV>(keyValues)...);
}

[[nodiscard]] auto withFields(const Fields& fields) -> Logger;
[[nodiscard]] auto withName(std::string_view name) -> Logger;
[[nodiscard]] auto fromContext(const Context& context) -> Logger;

auto write(std::string_view bytes,
           std::source_location location = std::source_location::current())
    -> std::size_t;
void flush();
[[nodiscard]] auto level() -> Severity;
void setLevel(Severity severity);

/**
 * @brief Stream recording each line at info on the current default logger
 */
[[nodiscard]] auto stdInfoStream() -> std::ostream&;

/**
 * @brief Stream recording each line at error on the current default logger
 */
[[nodiscard]] auto stdErrorStream() -> std::ostream&;

}  // namespace facet::logging

#endif  // FACET_LOGGING_GLOBAL_HPP
