/*
 * redirect_sink.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "redirect_sink.hpp"

#include <string_view>

#include <spdlog/spdlog.h>

namespace facet::logging {

template <typename Mutex>
RedirectSinkMt<Mutex>::RedirectSinkMt(Logger target)
    : target_(std::move(target)) {}

template <typename Mutex>
void RedirectSinkMt<Mutex>::sink_it_(const spdlog::details::log_msg& msg) {
    auto severity = fromSpdlogLevel(msg.level);
    if (!target_.enabled(severity)) {
        return;
    }

    std::string_view text(msg.payload.data(), msg.payload.size());
    Message message(text, Caller::from(msg.source));

    if (msg.logger_name.size() == 0) {
        target_.log(severity, message);
    } else {
        target_
            .withName(std::string_view(msg.logger_name.data(),
                                       msg.logger_name.size()))
            .log(severity, message);
    }
}

template <typename Mutex>
void RedirectSinkMt<Mutex>::flush_() {
    target_.flush();
}

void redirectAmbientLogging(const Logger& logger) {
    auto sink = std::make_shared<RedirectSink>(logger);
    auto ambient = std::make_shared<spdlog::logger>("", std::move(sink));
    ambient->set_level(spdlog::level::trace);
    spdlog::set_default_logger(std::move(ambient));
}

// Explicit template instantiation
template class RedirectSinkMt<std::mutex>;

}  // namespace facet::logging
