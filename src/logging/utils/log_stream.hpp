/*
 * log_stream.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: std::ostream adapters turning lines of text into log records

**************************************************/

#ifndef FACET_LOGGING_UTILS_LOG_STREAM_HPP
#define FACET_LOGGING_UTILS_LOG_STREAM_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>

#include "../core/logger.hpp"

namespace facet::logging {

/**
 * @brief Supplies the logger a stream writes to, looked up once per line
 */
using LoggerProvider = std::function<std::shared_ptr<const Logger>()>;

/**
 * @brief Line-buffered stream buffer emitting one record per line
 *
 * Text is collected until a newline; the line, without the newline, is then
 * recorded at the configured severity. Empty lines are dropped. pubsync()
 * and destruction emit a pending partial line. Safe to share between
 * threads; concurrent writers are serialized per character run.
 */
class LogStreamBuf : public std::streambuf {
public:
    LogStreamBuf(LoggerProvider provider, Severity severity);
    LogStreamBuf(Logger logger, Severity severity);
    ~LogStreamBuf() override;

    LogStreamBuf(const LogStreamBuf&) = delete;
    LogStreamBuf& operator=(const LogStreamBuf&) = delete;

protected:
    auto overflow(int_type ch) -> int_type override;
    auto xsputn(const char_type* s, std::streamsize count)
        -> std::streamsize override;
    auto sync() -> int override;

private:
    void append(const char* data, std::size_t size);
    void emitPending();

    LoggerProvider provider_;
    Severity severity_;
    std::string pending_;
    std::mutex mutex_;
};

/**
 * @brief std::ostream over a LogStreamBuf
 *
 * @code
 * LogStream out(logger.withName("legacy"), Severity::Warn);
 * out << "disk usage at " << percent << "%" << std::endl;
 * @endcode
 */
class LogStream : public std::ostream {
public:
    LogStream(LoggerProvider provider, Severity severity);
    LogStream(Logger logger, Severity severity);

    [[nodiscard]] auto buffer() noexcept -> LogStreamBuf& { return buffer_; }

private:
    LogStreamBuf buffer_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_UTILS_LOG_STREAM_HPP
