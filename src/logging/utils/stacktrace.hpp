/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FACET_LOGGING_STACKTRACE_HPP
#define FACET_LOGGING_STACKTRACE_HPP

#include <string>

namespace facet::logging {

/**
 * @brief Symbolized stack of the calling thread, one frame per line
 * @param skip Innermost frames to leave out (this function is always skipped)
 * @return Stack text, empty if the platform cannot provide one
 */
[[nodiscard]] auto captureStacktrace(int skip = 0) -> std::string;

}  // namespace facet::logging

#endif  // FACET_LOGGING_STACKTRACE_HPP
