/*
 * redirect_sink.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: spdlog sink forwarding records into a facade logger, used to
capture ambient spdlog logging

**************************************************/

#ifndef FACET_LOGGING_SINKS_REDIRECT_SINK_HPP
#define FACET_LOGGING_SINKS_REDIRECT_SINK_HPP

#include <mutex>

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include "../core/logger.hpp"

namespace facet::logging {

/**
 * @brief Sink that re-emits every spdlog record through a Logger
 *
 * Severity is mapped from the spdlog level, the spdlog source location
 * becomes the caller and a non-empty spdlog logger name is appended to the
 * target's name. Records are never escalated: a critical spdlog record is
 * written at error severity. The target decides what is enabled.
 */
template <typename Mutex>
class RedirectSinkMt : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit RedirectSinkMt(Logger target);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;

private:
    Logger target_;
};

using RedirectSink = RedirectSinkMt<std::mutex>;

/**
 * @brief Replace spdlog's default logger with one that forwards into
 * @p logger
 *
 * Afterwards spdlog::info(...) and friends, as used by libraries unaware of
 * this facade, end up in the same sinks as the logger's own records.
 */
void redirectAmbientLogging(const Logger& logger);

}  // namespace facet::logging

#endif  // FACET_LOGGING_SINKS_REDIRECT_SINK_HPP
