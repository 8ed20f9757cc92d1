/*
 * logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger.hpp"

#include <cstdlib>

#include "exceptions.hpp"

namespace facet::logging {

/**
 * @brief Info logger bound to one enabled severity of a Logger
 */
class LeveledInfoLogger final : public InfoLogger {
public:
    LeveledInfoLogger(Logger logger, Severity severity)
        : logger_(std::move(logger)), severity_(severity) {}

    [[nodiscard]] auto enabled() const noexcept -> bool override {
        return logger_.enabled(severity_);
    }

protected:
    void emit(const Message& message,
              std::span<const Field> fields) const override {
        logger_.writeFields(severity_, message, fields);
        logger_.escalate(severity_, message.text());
    }

    void emitKeyValues(const Message& message,
                       std::span<const KeyValue> args) const override {
        logger_.writeKeyValues(severity_, message, args);
        logger_.escalate(severity_, message.text());
    }

private:
    Logger logger_;
    Severity severity_;
};

auto Logger::create(const Options& options) -> Logger {
    return Logger(std::make_shared<Engine>(options), options.name);
}

Logger::Logger(std::shared_ptr<Engine> engine, std::string name)
    : engine_(std::move(engine)),
      name_(std::move(name)),
      fields_(std::make_shared<const Fields>()) {}

void Logger::dpanic(Message message, const Fields& fields) const {
    writeFields(Severity::DPanic, message, fields);
    if (engine_->development()) {
        raisePanic(message.text());
    }
}

void Logger::panic(Message message, const Fields& fields) const {
    writeFields(Severity::Panic, message, fields);
    raisePanic(message.text());
}

void Logger::fatal(Message message, const Fields& fields) const {
    writeFields(Severity::Fatal, message, fields);
    terminate();
}

auto Logger::v(int level) const -> std::shared_ptr<const InfoLogger> {
    auto severity = severityFromInt(level);
    if (!enabled(severity)) {
        return disabledInfoLogger();
    }
    return std::make_shared<const LeveledInfoLogger>(*this, severity);
}

auto Logger::withKeyValues(std::span<const KeyValue> args) const -> Logger {
    auto conversion = convertKeyValues(args);
    if (conversion.diagnostic) {
        reportDiagnostic(Caller{}, *conversion.diagnostic);
    }
    return withFields(conversion.fields);
}

auto Logger::withFields(const Fields& fields) const -> Logger {
    if (fields.empty()) {
        return *this;
    }
    auto merged = std::make_shared<Fields>(*fields_);
    merged->insert(merged->end(), fields.begin(), fields.end());

    Logger derived(*this);
    derived.fields_ = std::move(merged);
    return derived;
}

auto Logger::withName(std::string_view name) const -> Logger {
    if (name.empty()) {
        return *this;
    }
    Logger derived(*this);
    if (name_.empty()) {
        derived.name_ = std::string(name);
    } else {
        derived.name_ = name_ + "." + std::string(name);
    }
    return derived;
}

auto Logger::fromContext(const Context& context) const -> Logger {
    Fields fields;
    for (auto key : {KEY_REQUEST_ID, KEY_USERNAME, KEY_WATCHER_NAME}) {
        if (auto value = context.value(key)) {
            fields.push_back(Field{std::string(key), std::move(*value)});
        }
    }
    return withFields(fields);
}

auto Logger::write(std::string_view bytes, std::source_location location) const
    -> std::size_t {
    writeFields(Severity::Info, Message(bytes, Caller::from(location)), {});
    return bytes.size();
}

void Logger::flush() const { engine_->flush(); }

void Logger::writeFields(Severity severity, const Message& message,
                         std::span<const Field> fields) const {
    if (!engine_->enabled(severity)) {
        return;
    }
    engine_->write(severity, name_, message.caller(), message.text(),
                   *fields_, fields);
}

void Logger::writeKeyValues(Severity severity, const Message& message,
                            std::span<const KeyValue> args) const {
    if (!engine_->enabled(severity)) {
        return;
    }
    auto conversion = convertKeyValues(args);
    if (conversion.diagnostic) {
        reportDiagnostic(message.caller(), *conversion.diagnostic);
    }
    writeFields(severity, message, conversion.fields);
}

void Logger::reportDiagnostic(const Caller& caller,
                              const KeyValueDiagnostic& diagnostic) const {
    writeFields(Severity::Warn, Message(diagnostic.message, caller),
                std::span<const Field>(&diagnostic.detail, 1));
}

void Logger::dpanicKeyValues(const Message& message,
                             std::span<const KeyValue> args) const {
    writeKeyValues(Severity::DPanic, message, args);
    if (engine_->development()) {
        raisePanic(message.text());
    }
}

void Logger::panicKeyValues(const Message& message,
                            std::span<const KeyValue> args) const {
    writeKeyValues(Severity::Panic, message, args);
    raisePanic(message.text());
}

void Logger::fatalKeyValues(const Message& message,
                            std::span<const KeyValue> args) const {
    writeKeyValues(Severity::Fatal, message, args);
    terminate();
}

void Logger::escalate(Severity severity, std::string_view message) const {
    switch (severity) {
        case Severity::DPanic:
            if (engine_->development()) {
                raisePanic(message);
            }
            break;
        case Severity::Panic:
            raisePanic(message);
        case Severity::Fatal:
            terminate();
        default:
            break;
    }
}

void Logger::raisePanic(std::string_view message) const {
    engine_->flush();
    throw PanicError(std::string(message));
}

void Logger::terminate() const {
    engine_->flush();
    std::exit(EXIT_FAILURE);
}

}  // namespace facet::logging
