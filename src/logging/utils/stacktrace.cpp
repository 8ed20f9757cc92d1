/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stacktrace.hpp"

#include <stacktrace>

namespace facet::logging {

auto captureStacktrace(int skip) -> std::string {
    auto trace = std::stacktrace::current(
        static_cast<std::stacktrace::size_type>(skip) + 1);

    std::string result;
    for (const auto& frame : trace) {
        if (!result.empty()) {
            result += '\n';
        }
        auto description = frame.description();
        result += description.empty() ? "??" : description;

        auto file = frame.source_file();
        if (!file.empty()) {
            result += "\n\t";
            result += file;
            result += ':';
            result += std::to_string(frame.source_line());
        }
    }
    return result;
}

}  // namespace facet::logging
