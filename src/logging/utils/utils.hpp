/**
 * @file utils.hpp
 * @brief Aggregated header for logging utilities module.
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef FACET_LOGGING_UTILS_HPP
#define FACET_LOGGING_UTILS_HPP

#include "encoder.hpp"
#include "log_stream.hpp"
#include "sampler.hpp"
#include "stacktrace.hpp"

#endif  // FACET_LOGGING_UTILS_HPP
