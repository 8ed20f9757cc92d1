/**
 * @file logging.hpp
 * @brief Main aggregated header for the Facet logging library.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * using namespace facet::logging;
 *
 * auto options = Options::createDefault();
 * options.level = "debug";
 * options.format = "json";
 * init(options);
 *
 * infow("server started", "port", 8080);
 * auto requestLogger = fromContext(
 *     Context{}.withValue(std::string(KEY_REQUEST_ID), "42"));
 * requestLogger.warnf("slow response: %d ms", 350);
 *
 * if (auto verbose = v(-1); verbose->enabled()) {
 *     verbose->info("cache state", {field::any("entries", 12)});
 * }
 * flush();
 * @endcode
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef FACET_LOGGING_LOGGING_HPP
#define FACET_LOGGING_LOGGING_HPP

// ============================================================================
// Core Module
// ============================================================================
// Severities, fields, options, the engine, loggers and the default instance

#include "core/core.hpp"

// ============================================================================
// Sinks Module
// ============================================================================
// Output sink construction and the ambient spdlog redirect

#include "sinks/sinks.hpp"

// ============================================================================
// Utils Module
// ============================================================================
// Encoders, sampling, stacktraces and stream adapters

#include "utils/utils.hpp"

namespace facet::logging {

inline constexpr const char* LOGGING_VERSION = "1.0.0";

}  // namespace facet::logging

#endif  // FACET_LOGGING_LOGGING_HPP
