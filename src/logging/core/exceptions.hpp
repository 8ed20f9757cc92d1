/*
 * exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging Exceptions

**************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace facet::logging {

/**
 * @brief Base class of every exception thrown by the logging library.
 */
class LoggingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Construction Exceptions
// ============================================================================

/**
 * @brief Exception thrown when a logger engine cannot be constructed
 * (unopenable sink, unknown encoder).
 */
class BuildError : public LoggingError {
public:
    using LoggingError::LoggingError;
};

/**
 * @brief Exception thrown when an options document cannot be read or parsed.
 */
class ConfigError : public LoggingError {
public:
    using LoggingError::LoggingError;
};

// ============================================================================
// Escalation Exceptions
// ============================================================================

/**
 * @brief Exception thrown by panic-severity calls after the record has been
 * written and flushed.
 */
class PanicError : public LoggingError {
public:
    using LoggingError::LoggingError;
};

}  // namespace facet::logging
