/*
 * test_redirect_sink.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for forwarding spdlog records into loggers

**************************************************/

#include <gtest/gtest.h>

#include "logging/core/logger.hpp"
#include "logging/log_capture.hpp"
#include "logging/sinks/redirect_sink.hpp"

#include <spdlog/spdlog.h>

using namespace facet::logging;

class RedirectSinkTest : public ::testing::Test {
protected:
    void SetUp() override { previous_ = spdlog::default_logger(); }

    void TearDown() override { spdlog::set_default_logger(previous_); }

    facet::logging::testing::LogCapture capture_{"redirect"};
    std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(RedirectSinkTest, ForwardsPayloadAndMapsLevels) {
    auto logger = Logger::create(capture_.options());
    spdlog::logger source("", std::make_shared<RedirectSink>(logger));
    source.set_level(spdlog::level::trace);

    source.trace("t");
    source.warn("w {}", 1);
    source.critical("c");
    logger.flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 3U);
    EXPECT_EQ(records[0]["level"], "DEBUG");
    EXPECT_EQ(records[1]["level"], "WARN");
    EXPECT_EQ(records[1]["message"], "w 1");
    // critical is recorded without escalating
    EXPECT_EQ(records[2]["level"], "ERROR");
}

TEST_F(RedirectSinkTest, TargetThresholdApplies) {
    auto options = capture_.options();
    options.level = "warn";
    auto logger = Logger::create(options);
    spdlog::logger source("", std::make_shared<RedirectSink>(logger));
    source.set_level(spdlog::level::trace);

    source.info("dropped");
    source.error("kept");
    logger.flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0]["message"], "kept");
}

TEST_F(RedirectSinkTest, SpdlogLoggerNameExtendsTargetName) {
    auto options = capture_.options();
    options.name = "app";
    auto logger = Logger::create(options);
    spdlog::logger source("db", std::make_shared<RedirectSink>(logger));

    source.info("connected");
    logger.flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0]["logger"], "app.db");
}

TEST_F(RedirectSinkTest, SourceLocationBecomesCaller) {
    auto logger = Logger::create(capture_.options());
    spdlog::logger source("", std::make_shared<RedirectSink>(logger));

    source.log(spdlog::source_loc{"/x/vendor/lib.cpp", 17, "fn"},
               spdlog::level::info, "from library");
    source.log(spdlog::level::info, "no location");
    logger.flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[0]["caller"], "vendor/lib.cpp:17");
    EXPECT_FALSE(records[1].contains("caller"));
}

TEST_F(RedirectSinkTest, BoundFieldsAreAttached) {
    auto logger = Logger::create(capture_.options()).withValues("svc", "api");
    spdlog::logger source("", std::make_shared<RedirectSink>(logger));

    source.info("hello");
    logger.flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0]["svc"], "api");
}

TEST_F(RedirectSinkTest, RedirectAmbientLogging) {
    auto logger = Logger::create(capture_.options());
    redirectAmbientLogging(logger);

    spdlog::info("ambient {}", "line");
    spdlog::default_logger()->flush();

    auto records = capture_.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0]["message"], "ambient line");
    // spdlog::info() without the SPDLOG_ macros carries no source location
    EXPECT_FALSE(records[0].contains("caller"));
}
