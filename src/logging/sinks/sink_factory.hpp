/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from output paths

**************************************************/

#ifndef FACET_LOGGING_SINKS_SINK_FACTORY_HPP
#define FACET_LOGGING_SINKS_SINK_FACTORY_HPP

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace facet::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Output paths are resolved as:
 * - "stdout" / "stderr": the process standard streams
 * - anything else: a file, opened for appending and created if missing
 *
 * Sinks write pre-encoded records, so their pattern is the bare payload.
 */
class SinkFactory {
public:
    static constexpr std::string_view STDOUT = "stdout";
    static constexpr std::string_view STDERR = "stderr";

    /**
     * @brief Create a sink for one output path
     * @throws BuildError if the path cannot be opened
     */
    [[nodiscard]] static auto createSink(const std::string& path)
        -> spdlog::sink_ptr;

    /**
     * @brief Create sinks for every path, in order
     * @throws BuildError on the first path that cannot be opened
     */
    [[nodiscard]] static auto createSinks(const std::vector<std::string>& paths)
        -> std::vector<spdlog::sink_ptr>;

    /**
     * @brief Create a standard stream sink
     * @param toStderr Write to stderr instead of stdout
     */
    [[nodiscard]] static auto createConsoleSink(bool toStderr = false)
        -> spdlog::sink_ptr;

    /**
     * @brief Create an appending file sink
     * @param file_path Path to log file; missing parent directories are
     * created
     */
    [[nodiscard]] static auto createFileSink(const std::string& file_path)
        -> spdlog::sink_ptr;

private:
    static void usePayloadPattern(const spdlog::sink_ptr& sink);
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_SINKS_SINK_FACTORY_HPP
