/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for severities, callers and messages

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/core/types.hpp"

#include <string>

using namespace facet::logging;

// ============================================================================
// Severity Tests
// ============================================================================

TEST(SeverityTest, OrderingMatchesNumericValues) {
    EXPECT_LT(Severity::Debug, Severity::Info);
    EXPECT_LT(Severity::Info, Severity::Warn);
    EXPECT_LT(Severity::Warn, Severity::Error);
    EXPECT_LT(Severity::Error, Severity::DPanic);
    EXPECT_LT(Severity::DPanic, Severity::Panic);
    EXPECT_LT(Severity::Panic, Severity::Fatal);
    EXPECT_EQ(toInt(Severity::Debug), -1);
    EXPECT_EQ(toInt(Severity::Fatal), 5);
}

TEST(SeverityTest, ParseLowerAndUpperCaseNames) {
    EXPECT_EQ(parseSeverity("debug"), Severity::Debug);
    EXPECT_EQ(parseSeverity("INFO"), Severity::Info);
    EXPECT_EQ(parseSeverity("warn"), Severity::Warn);
    EXPECT_EQ(parseSeverity("ERROR"), Severity::Error);
    EXPECT_EQ(parseSeverity("dpanic"), Severity::DPanic);
    EXPECT_EQ(parseSeverity("panic"), Severity::Panic);
    EXPECT_EQ(parseSeverity("FATAL"), Severity::Fatal);
}

TEST(SeverityTest, ParseEmptySelectsInfo) {
    EXPECT_EQ(parseSeverity(""), Severity::Info);
}

TEST(SeverityTest, ParseRejectsUnknownNames) {
    EXPECT_FALSE(parseSeverity("verbose").has_value());
    EXPECT_FALSE(parseSeverity("Info").has_value());
    EXPECT_FALSE(parseSeverity("warning").has_value());
}

TEST(SeverityTest, ToStringForKnownAndCustomLevels) {
    EXPECT_EQ(severityToString(Severity::DPanic), "dpanic");
    EXPECT_EQ(severityToCapitalString(Severity::Warn), "WARN");
    EXPECT_EQ(severityToString(severityFromInt(7)), "Level(7)");
    EXPECT_EQ(severityToCapitalString(severityFromInt(-3)), "LEVEL(-3)");
}

TEST(SeverityTest, FromIntClampsToRepresentableRange) {
    EXPECT_EQ(severityFromInt(2), Severity::Error);
    EXPECT_EQ(toInt(severityFromInt(1000)), 127);
    EXPECT_EQ(toInt(severityFromInt(-1000)), -128);
}

TEST(SeverityTest, SpdlogLevelMapping) {
    EXPECT_EQ(toSpdlogLevel(Severity::Debug), spdlog::level::debug);
    EXPECT_EQ(toSpdlogLevel(Severity::Error), spdlog::level::err);
    EXPECT_EQ(toSpdlogLevel(Severity::Fatal), spdlog::level::critical);
    EXPECT_EQ(toSpdlogLevel(severityFromInt(-5)), spdlog::level::trace);

    EXPECT_EQ(fromSpdlogLevel(spdlog::level::trace), Severity::Debug);
    EXPECT_EQ(fromSpdlogLevel(spdlog::level::warn), Severity::Warn);
    EXPECT_EQ(fromSpdlogLevel(spdlog::level::critical), Severity::Error);
}

// ============================================================================
// Caller Tests
// ============================================================================

TEST(CallerTest, DefaultIsUndefined) {
    Caller caller;
    EXPECT_FALSE(caller.defined());
    EXPECT_EQ(caller.toShortString(), "undefined");
}

TEST(CallerTest, ShortStringKeepsLastDirectory) {
    Caller caller{"/home/build/src/logging/core/logger.cpp", 42, "f"};
    EXPECT_EQ(caller.toShortString(), "core/logger.cpp:42");
}

TEST(CallerTest, ShortStringWithoutDirectory) {
    Caller caller{"main.cpp", 7, "main"};
    EXPECT_EQ(caller.toShortString(), "main.cpp:7");
}

TEST(CallerTest, FromSpdlogSourceLocation) {
    spdlog::source_loc loc{"/a/b/c.cpp", 12, "fn"};
    auto caller = Caller::from(loc);
    EXPECT_TRUE(caller.defined());
    EXPECT_EQ(caller.line, 12);
    EXPECT_EQ(caller.toShortString(), "b/c.cpp:12");
}

TEST(CallerTest, FromEmptySpdlogSourceLocationIsUndefined) {
    EXPECT_FALSE(Caller::from(spdlog::source_loc{}).defined());
}

// ============================================================================
// Message Tests
// ============================================================================

namespace {

auto captureMessage(Message message) -> Message { return message; }

}  // namespace

TEST(MessageTest, CapturesCallSite) {
    int line = __LINE__ + 1;
    auto message = captureMessage("hello");
    EXPECT_EQ(message.text(), "hello");
    EXPECT_EQ(message.caller().line, line);
    EXPECT_THAT(message.caller().toShortString(),
                ::testing::HasSubstr("test_types.cpp"));
}

TEST(MessageTest, AcceptsStdString) {
    std::string text = "from string";
    auto message = captureMessage(text);
    EXPECT_EQ(message.text(), "from string");
    EXPECT_TRUE(message.caller().defined());
}

TEST(MessageTest, NullTextBecomesEmpty) {
    const char* text = nullptr;
    auto message = captureMessage(text);
    EXPECT_TRUE(message.text().empty());
}

TEST(MessageTest, ExplicitCaller) {
    Message message("text", Caller{"x/y.cpp", 3, "g"});
    EXPECT_EQ(message.caller().toShortString(), "x/y.cpp:3");
}
