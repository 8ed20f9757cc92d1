/*
 * logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logger facade - leveled structured, printf-style and key/value
logging on top of a shared engine

**************************************************/

#ifndef FACET_LOGGING_LOGGER_HPP
#define FACET_LOGGING_LOGGER_HPP

#include <cstddef>
#include <memory>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "context.hpp"
#include "engine.hpp"
#include "field.hpp"
#include "info_logger.hpp"
#include "options.hpp"
#include "types.hpp"

namespace facet::logging {

class LeveledInfoLogger;

/**
 * @brief Immutable logger handle
 *
 * Copies are cheap: the engine is shared and the bound fields are shared
 * until a derivation appends to them. Derivations (withValues, withFields,
 * withName, fromContext) return new loggers and leave their source unchanged.
 *
 * Every severity has three call shapes:
 * - structured: info("msg", {field::any("k", v)})
 * - printf-style: infof("%d items", n)
 * - key/value: infow("msg", "k1", v1, "k2", v2)
 *
 * panic() flushes and throws PanicError, fatal() flushes and exits the
 * process with status 1, dpanic() behaves like panic() in development mode.
 * Both panic and fatal escalate even when their severity is disabled.
 */
class Logger {
public:
    /**
     * @brief Build a logger from options (without installing it as default)
     * @throws BuildError if a sink cannot be opened or the format is unknown
     */
    [[nodiscard]] static auto create(const Options& options) -> Logger;

    explicit Logger(std::shared_ptr<Engine> engine, std::string name = {});

    [[nodiscard]] auto enabled(Severity severity) const noexcept -> bool {
        return engine_->enabled(severity);
    }

    // ========================================================================
    // Structured
    // ========================================================================

    void debug(Message message, const Fields& fields = {}) const {
        writeFields(Severity::Debug, message, fields);
    }
    void info(Message message, const Fields& fields = {}) const {
        writeFields(Severity::Info, message, fields);
    }
    void warn(Message message, const Fields& fields = {}) const {
        writeFields(Severity::Warn, message, fields);
    }
    void error(Message message, const Fields& fields = {}) const {
        writeFields(Severity::Error, message, fields);
    }
    void dpanic(Message message, const Fields& fields = {}) const;
    [[noreturn]] void panic(Message message, const Fields& fields = {}) const;
    [[noreturn]] void fatal(Message message, const Fields& fields = {}) const;

    /**
     * @brief Record at any severity; never escalates
     */
    void log(Severity severity, Message message,
             const Fields& fields = {}) const {
        writeFields(severity, message, fields);
    }

    // ========================================================================
    // printf-style
    // ========================================================================

    template <typename... Args>
    void debugf(Message format, const Args&... args) const {
        logf(Severity::Debug, format, args...);
    }
    template <typename... Args>
    void infof(Message format, const Args&... args) const {
        logf(Severity::Info, format, args...);
    }
    template <typename... Args>
    void warnf(Message format, const Args&... args) const {
        logf(Severity::Warn, format, args...);
    }
    template <typename... Args>
    void errorf(Message format, const Args&... args) const {
        logf(Severity::Error, format, args...);
    }
    template <typename... Args>
    void dpanicf(Message format, const Args&... args) const {
        if (!enabled(Severity::DPanic) && !engine_->development()) {
            return;
        }
        auto text = detail::sprintfMessage(format.text(), args...);
        dpanic(Message(text, format.caller()));
    }
    template <typename... Args>
    [[noreturn]] void panicf(Message format, const Args&... args) const {
        auto text = detail::sprintfMessage(format.text(), args...);
        panic(Message(text, format.caller()));
    }
    template <typename... Args>
    [[noreturn]] void fatalf(Message format, const Args&... args) const {
        auto text = detail::sprintfMessage(format.text(), args...);
        fatal(Message(text, format.caller()));
    }

    template <typename... Args>
    void logf(Severity severity, const Message& format,
              const Args&... args) const {
        if (!enabled(severity)) {
            return;
        }
        auto text = detail::sprintfMessage(format.text(), args...);
        writeFields(severity, Message(text, format.caller()), {});
    }

    // ========================================================================
    // Key/value
    // ========================================================================

    template <typename... KV>
    void debugw(Message message, KV&&... keyValues) const {
        logw(Severity::Debug, message, std::forward<KV>(keyValues)...);
    }
    template <typename... KV>
    void infow(Message message, KV&&... keyValues) const {
        logw(Severity::Info, message, std::forward<KV>(keyValues)...);
    }
    template <typename... KV>
    void warnw(Message message, KV&&... keyValues) const {
        logw(Severity::Warn, message, std::forward<KV>(keyValues)...);
    }
    template <typename... KV>
    void errorw(Message message, KV&&... keyValues) const {
        logw(Severity::Error, message, std::forward<KV>(keyValues)...);
    }
    template <typename... KV>
    void dpanicw(Message message, KV&&... keyValues) const {
        if (!enabled(Severity::DPanic) && !engine_->development()) {
            return;
        }
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        dpanicKeyValues(message, args);
    }
    template <typename... KV>
    [[noreturn]] void panicw(Message message, KV&&... keyValues) const {
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        panicKeyValues(message, args);
    }
    template <typename... KV>
    [[noreturn]] void fatalw(Message message, KV&&... keyValues) const {
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        fatalKeyValues(message, args);
    }

    template <typename... KV>
    void logw(Severity severity, const Message& message,
              KV&&... keyValues) const {
        if (!enabled(severity)) {
            return;
        }
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        writeKeyValues(severity, message, args);
    }

    // ========================================================================
    // Verbosity
    // ========================================================================

    /**
     * @brief Info logger gated at severity @p level
     *
     * Returns the shared disabled logger when @p level is below the
     * threshold. Records emitted at dpanic, panic or fatal escalate the same
     * way as the corresponding methods of this logger.
     */
    [[nodiscard]] auto v(int level) const -> std::shared_ptr<const InfoLogger>;

    // ========================================================================
    // Derivation
    // ========================================================================

    template <typename... KV>
    [[nodiscard]] auto withValues(KV&&... keyValues) const -> Logger {
        KeyValues args{KeyValue(std::forward<KV>(keyValues))...};
        return withKeyValues(args);
    }

    /**
     * @brief Logger with converted key/value pairs appended to the bound
     * fields; malformed input is reported as a warning on this logger
     */
    [[nodiscard]] auto withKeyValues(std::span<const KeyValue> args) const
        -> Logger;

    [[nodiscard]] auto withFields(const Fields& fields) const -> Logger;

    /**
     * @brief Logger named "parent.name", or "name" for an unnamed parent
     */
    [[nodiscard]] auto withName(std::string_view name) const -> Logger;

    /**
     * @brief Logger carrying the well-known context values as bound fields
     *
     * Adds requestID, username and watcher, in that order, for each key the
     * context holds.
     */
    [[nodiscard]] auto fromContext(const Context& context) const -> Logger;

    // ========================================================================
    // Output control
    // ========================================================================

    /**
     * @brief Emit @p bytes verbatim as one info record
     * @return Always bytes.size()
     */
    auto write(std::string_view bytes,
               std::source_location location =
                   std::source_location::current()) const -> std::size_t;

    /**
     * @brief Block until every sink has written its buffered records
     */
    void flush() const;

    [[nodiscard]] auto level() const noexcept -> Severity {
        return engine_->level();
    }

    /**
     * @brief Change the threshold shared by all loggers of this engine
     */
    void setLevel(Severity severity) const noexcept {
        engine_->setLevel(severity);
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }
    [[nodiscard]] auto fields() const noexcept -> const Fields& {
        return *fields_;
    }
    [[nodiscard]] auto engine() const noexcept
        -> const std::shared_ptr<Engine>& {
        return engine_;
    }

private:
    friend class LeveledInfoLogger;

    void writeFields(Severity severity, const Message& message,
                     std::span<const Field> fields) const;
    void writeKeyValues(Severity severity, const Message& message,
                        std::span<const KeyValue> args) const;
    void reportDiagnostic(const Caller& caller,
                          const KeyValueDiagnostic& diagnostic) const;

    void dpanicKeyValues(const Message& message,
                         std::span<const KeyValue> args) const;
    [[noreturn]] void panicKeyValues(const Message& message,
                                     std::span<const KeyValue> args) const;
    [[noreturn]] void fatalKeyValues(const Message& message,
                                     std::span<const KeyValue> args) const;

    void escalate(Severity severity, std::string_view message) const;
    [[noreturn]] void raisePanic(std::string_view message) const;
    [[noreturn]] void terminate() const;

    std::shared_ptr<Engine> engine_;
    std::string name_;
    std::shared_ptr<const Fields> fields_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_LOGGER_HPP
