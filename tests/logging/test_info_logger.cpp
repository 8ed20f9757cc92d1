/*
 * test_info_logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for the level-gated info logger

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/core/info_logger.hpp"

#include <string>

using namespace facet::logging;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

/**
 * @brief Info logger recording what reaches the emission hooks
 */
class MockInfoLogger : public InfoLogger {
public:
    MOCK_METHOD(bool, enabled, (), (const, noexcept, override));
    MOCK_METHOD(void, emit, (const Message&, std::span<const Field>),
                (const, override));
    MOCK_METHOD(void, emitKeyValues,
                (const Message&, std::span<const KeyValue>),
                (const, override));
};

}  // namespace

TEST(InfoLoggerTest, DisabledLoggerSkipsHooks) {
    MockInfoLogger logger;
    EXPECT_CALL(logger, enabled()).WillRepeatedly(Return(false));
    EXPECT_CALL(logger, emit(_, _)).Times(0);
    EXPECT_CALL(logger, emitKeyValues(_, _)).Times(0);

    logger.info("m", {field::any("k", 1)});
    logger.infof("%d", 1);
    logger.infow("m", "k", 1);
}

TEST(InfoLoggerTest, InfoPassesFields) {
    MockInfoLogger logger;
    EXPECT_CALL(logger, enabled()).WillRepeatedly(Return(true));
    EXPECT_CALL(logger, emit(_, _))
        .WillOnce([](const Message& message, std::span<const Field> fields) {
            EXPECT_EQ(message.text(), "m");
            ASSERT_EQ(fields.size(), 1U);
            EXPECT_EQ(fields[0].key, "k");
        });

    logger.info("m", {field::any("k", 1)});
}

TEST(InfoLoggerTest, InfofFormatsBeforeEmitting) {
    MockInfoLogger logger;
    EXPECT_CALL(logger, enabled()).WillRepeatedly(Return(true));
    EXPECT_CALL(logger, emit(_, _))
        .WillOnce([](const Message& message, std::span<const Field> fields) {
            EXPECT_EQ(message.text(), "7 of 9");
            EXPECT_TRUE(fields.empty());
            EXPECT_TRUE(message.caller().defined());
        });

    logger.infof("%d of %d", 7, 9);
}

TEST(InfoLoggerTest, InfowHandsOverArgumentsUnconverted) {
    MockInfoLogger logger;
    EXPECT_CALL(logger, enabled()).WillRepeatedly(Return(true));
    EXPECT_CALL(logger, emitKeyValues(_, _))
        .WillOnce(
            [](const Message& message, std::span<const KeyValue> args) {
                EXPECT_EQ(message.text(), "m");
                ASSERT_EQ(args.size(), 3U);
                EXPECT_FALSE(args[0].isField());
                EXPECT_TRUE(args[2].isField());
            });

    logger.infow("m", "k", 1, field::any("typed", true));
}

TEST(InfoLoggerTest, NoopLoggerIsDisabled) {
    NoopInfoLogger logger;
    EXPECT_FALSE(logger.enabled());
    logger.info("nothing");
}

TEST(InfoLoggerTest, DisabledSingletonIsStable) {
    auto first = disabledInfoLogger();
    auto second = disabledInfoLogger();
    EXPECT_EQ(first.get(), second.get());
    EXPECT_FALSE(first->enabled());
    EXPECT_EQ(first.use_count(), 0);
}

TEST(SprintfMessageTest, FormatsArguments) {
    EXPECT_EQ(detail::sprintfMessage("%s=%d", std::string("a"), 1), "a=1");
    EXPECT_EQ(detail::sprintfMessage("%.2f", 1.5), "1.50");
}

TEST(SprintfMessageTest, NoArgumentsKeepsPercentSigns) {
    EXPECT_EQ(detail::sprintfMessage("50% done"), "50% done");
}

TEST(SprintfMessageTest, MissingArgumentDegrades) {
    auto text = detail::sprintfMessage("%d %d", 1);
    EXPECT_THAT(text, HasSubstr("%d %d"));
    EXPECT_THAT(text, HasSubstr("format error"));
}
