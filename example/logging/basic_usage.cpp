/*
 * basic_usage.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Example of configuring and using the logging facade

**************************************************/

#include "logging/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace facet::logging;

namespace {

void handleRequest(const Logger& base, const Context& context) {
    auto logger = base.fromContext(context).withName("handler");

    logger.infow("request received", "path", "/api/v1/status", "bytes", 512);
    if (auto verbose = logger.v(-1); verbose->enabled()) {
        verbose->infof("cache lookup took %.3f ms", 0.125);
    }

    try {
        throw std::runtime_error("upstream timed out");
    } catch (const std::exception& e) {
        logger.error("request failed", {field::error(e)});
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = Options::createDefault();
    if (argc > 1) {
        try {
            options = Options::loadFromFile(argv[1]);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    } else {
        options.level = "debug";
        options.enableColor = true;
        options.name = "example";
    }

    if (auto result = options.validate(); !result.isValid) {
        std::cerr << "invalid options: " << result.getErrorMessage()
                  << std::endl;
        return EXIT_FAILURE;
    }

    try {
        init(options);
    } catch (const BuildError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    infow("logging initialized", "version", LOGGING_VERSION, "options",
          options.toJson());

    auto context = Context{}
                       .withValue(std::string(KEY_REQUEST_ID), "req-7f3a")
                       .withValue(std::string(KEY_USERNAME), "ada");
    handleRequest(*defaultLogger(), context);

    // Libraries logging through spdlog end up in the same output
    spdlog::warn("third-party component is using a deprecated option");

    stdErrorStream() << "legacy component wrote to an error stream"
                     << std::endl;

    withValues("malformed").info("odd key/value lists are reported, not thrown");

    try {
        panic("unrecoverable state");
    } catch (const PanicError& e) {
        std::cerr << "recovered from panic: " << e.what() << std::endl;
    }

    flush();
    return EXIT_SUCCESS;
}
