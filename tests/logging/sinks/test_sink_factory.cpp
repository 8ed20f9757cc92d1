/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for SinkFactory

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/core/exceptions.hpp"
#include "logging/log_capture.hpp"
#include "logging/sinks/sink_factory.hpp"

#include <spdlog/sinks/sink.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace facet::logging;

class SinkFactoryTest : public ::testing::Test {
protected:
    facet::logging::testing::LogCapture capture_{"sink_factory"};
};

// ============================================================================
// Console Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, StandardStreamNames) {
    EXPECT_NE(SinkFactory::createSink("stdout"), nullptr);
    EXPECT_NE(SinkFactory::createSink("stderr"), nullptr);
}

TEST_F(SinkFactoryTest, ConsoleSinkAcceptsEverySeverity) {
    auto sink = SinkFactory::createConsoleSink(true);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::trace);
}

// ============================================================================
// File Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, FileSinkWritesPayloadOnly) {
    auto path = (capture_.dir() / "payload.log").string();
    auto sink = SinkFactory::createSink(path);

    spdlog::logger logger("payload", sink);
    logger.info("already encoded line");
    logger.flush();

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "already encoded line");
}

TEST_F(SinkFactoryTest, FileSinkAppends) {
    auto path = (capture_.dir() / "append.log").string();
    {
        std::ofstream out(path);
        out << "existing\n";
    }

    {
        spdlog::logger logger("append", SinkFactory::createFileSink(path));
        logger.info("new");
        logger.flush();
    }

    std::ifstream in(path);
    std::string first;
    std::string second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_EQ(first, "existing");
    EXPECT_EQ(second, "new");
}

TEST_F(SinkFactoryTest, FileSinkCreatesParentDirectories) {
    auto path = capture_.dir() / "nested" / "deeper" / "app.log";
    EXPECT_NE(SinkFactory::createSink(path.string()), nullptr);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(SinkFactoryTest, UnopenablePathThrowsBuildError) {
    try {
        (void)SinkFactory::createSink(capture_.dir().string());
        FAIL() << "expected BuildError";
    } catch (const BuildError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("couldn't open sink"));
    }
}

TEST_F(SinkFactoryTest, CreateSinksKeepsOrder) {
    auto sinks = SinkFactory::createSinks(
        {"stdout", (capture_.dir() / "a.log").string()});
    ASSERT_EQ(sinks.size(), 2U);
    EXPECT_NE(sinks[0], sinks[1]);
}

TEST_F(SinkFactoryTest, CreateSinksFailsOnAnyBadPath) {
    EXPECT_THROW((void)SinkFactory::createSinks(
                     {"stdout", capture_.dir().string()}),
                 BuildError);
}
