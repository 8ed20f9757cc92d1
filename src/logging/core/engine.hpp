/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging engine - sinks, threshold, encoding and sampling shared
by every logger derived from one configuration

**************************************************/

#ifndef FACET_LOGGING_ENGINE_HPP
#define FACET_LOGGING_ENGINE_HPP

#include <atomic>
#include <memory>
#include <span>
#include <string_view>

#include <spdlog/spdlog.h>

#include "../utils/encoder.hpp"
#include "../utils/sampler.hpp"
#include "field.hpp"
#include "options.hpp"
#include "types.hpp"

namespace facet::logging {

/**
 * @brief Shared core of a logger family
 *
 * Provides:
 * - An atomic threshold, checked without locks or allocation
 * - Encoding of records (console or JSON) and delivery to spdlog sinks
 * - Optional sampling of repeated records
 * - Caller and stacktrace capture policy
 * - Error output for failures inside the write path
 *
 * Everything except the threshold is fixed at construction. The engine never
 * throws from write() and never unwinds or exits on its own; escalation of
 * panic and fatal records is up to the caller.
 */
class Engine {
public:
    /**
     * @brief Build an engine from options
     *
     * An unrecognized level falls back to info.
     *
     * @throws BuildError if a sink cannot be opened or the format is unknown
     */
    explicit Engine(const Options& options);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] auto enabled(Severity severity) const noexcept -> bool {
        return toInt(severity) >= level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto level() const noexcept -> Severity {
        return severityFromInt(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Change the threshold of every logger sharing this engine
     */
    void setLevel(Severity severity) noexcept {
        level_.store(toInt(severity), std::memory_order_relaxed);
    }

    [[nodiscard]] auto development() const noexcept -> bool {
        return development_;
    }

    /**
     * @brief Encode and write one record
     *
     * Does not check the threshold; callers check enabled() first so that
     * disabled records cost nothing.
     */
    void write(Severity severity, std::string_view loggerName,
               const Caller& caller, std::string_view message,
               std::span<const Field> context, std::span<const Field> fields);

    /**
     * @brief Block until every sink has flushed its buffered records
     */
    void flush();

    /**
     * @brief Write a failure of the logging machinery to the error output
     */
    void reportError(std::string_view message);

private:
    std::atomic<int> level_;
    bool captureCaller_;
    bool captureStacktrace_;
    bool development_;
    Severity stacktraceLevel_{Severity::Panic};

    std::unique_ptr<Encoder> encoder_;
    std::unique_ptr<Sampler> sampler_;
    std::shared_ptr<spdlog::logger> output_;
    std::shared_ptr<spdlog::logger> errorOutput_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_ENGINE_HPP
