/*
 * log_stream.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_stream.hpp"

#include <exception>
#include <string_view>
#include <utility>

namespace facet::logging {

LogStreamBuf::LogStreamBuf(LoggerProvider provider, Severity severity)
    : provider_(std::move(provider)), severity_(severity) {}

LogStreamBuf::LogStreamBuf(Logger logger, Severity severity)
    : LogStreamBuf(
          [shared = std::make_shared<const Logger>(std::move(logger))]() {
              return shared;
          },
          severity) {}

LogStreamBuf::~LogStreamBuf() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        emitPending();
    } catch (const std::exception&) {
        // The partial line is lost
    }
}

auto LogStreamBuf::overflow(int_type ch) -> int_type {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    char c = traits_type::to_char_type(ch);
    std::lock_guard<std::mutex> lock(mutex_);
    append(&c, 1);
    return ch;
}

auto LogStreamBuf::xsputn(const char_type* s, std::streamsize count)
    -> std::streamsize {
    if (count <= 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    append(s, static_cast<std::size_t>(count));
    return count;
}

auto LogStreamBuf::sync() -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    emitPending();
    return 0;
}

void LogStreamBuf::append(const char* data, std::size_t size) {
    std::string_view text(data, size);
    while (!text.empty()) {
        auto newline = text.find('\n');
        if (newline == std::string_view::npos) {
            pending_.append(text);
            return;
        }
        pending_.append(text.substr(0, newline));
        emitPending();
        text.remove_prefix(newline + 1);
    }
}

void LogStreamBuf::emitPending() {
    if (pending_.empty()) {
        return;
    }
    std::string line;
    line.swap(pending_);
    if (auto logger = provider_()) {
        logger->log(severity_, Message(line, Caller{}));
    }
}

LogStream::LogStream(LoggerProvider provider, Severity severity)
    : std::ostream(nullptr), buffer_(std::move(provider), severity) {
    rdbuf(&buffer_);
}

LogStream::LogStream(Logger logger, Severity severity)
    : std::ostream(nullptr), buffer_(std::move(logger), severity) {
    rdbuf(&buffer_);
}

}  // namespace facet::logging
