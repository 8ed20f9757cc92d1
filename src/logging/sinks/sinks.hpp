/**
 * @file sinks.hpp
 * @brief Aggregated header for logging sinks module.
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef FACET_LOGGING_SINKS_HPP
#define FACET_LOGGING_SINKS_HPP

#include "redirect_sink.hpp"
#include "sink_factory.hpp"

#endif  // FACET_LOGGING_SINKS_HPP
