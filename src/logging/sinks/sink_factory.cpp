/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "../core/exceptions.hpp"

namespace facet::logging {

auto SinkFactory::createSink(const std::string& path) -> spdlog::sink_ptr {
    try {
        if (path == STDOUT) {
            return createConsoleSink(false);
        }
        if (path == STDERR) {
            return createConsoleSink(true);
        }
        return createFileSink(path);
    } catch (const spdlog::spdlog_ex& e) {
        throw BuildError("couldn't open sink \"" + path + "\": " + e.what());
    }
}

auto SinkFactory::createSinks(const std::vector<std::string>& paths)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.reserve(paths.size());
    for (const auto& path : paths) {
        sinks.push_back(createSink(path));
    }
    return sinks;
}

auto SinkFactory::createConsoleSink(bool toStderr) -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (toStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    usePayloadPattern(sink);
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        file_path, /*truncate=*/false);
    usePayloadPattern(sink);
    return sink;
}

void SinkFactory::usePayloadPattern(const spdlog::sink_ptr& sink) {
    sink->set_level(spdlog::level::trace);
    sink->set_pattern("%v");
}

}  // namespace facet::logging
