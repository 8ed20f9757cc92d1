/**
 * @file core.hpp
 * @brief Aggregated header for the logging core module.
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef FACET_LOGGING_CORE_HPP
#define FACET_LOGGING_CORE_HPP

#include "context.hpp"
#include "engine.hpp"
#include "exceptions.hpp"
#include "field.hpp"
#include "global.hpp"
#include "info_logger.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "types.hpp"

#endif  // FACET_LOGGING_CORE_HPP
