/*
 * test_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for the immutable logging context

**************************************************/

#include <gtest/gtest.h>

#include "logging/core/context.hpp"
#include "logging/json_printer.hpp"

#include <string>
#include <thread>

using namespace facet::logging;

TEST(ContextTest, EmptyContextHasNoValues) {
    Context context;
    EXPECT_TRUE(context.empty());
    EXPECT_FALSE(context.value(KEY_REQUEST_ID).has_value());
}

TEST(ContextTest, WithValueStoresValue) {
    auto context = Context{}.withValue(std::string(KEY_USERNAME), "ada");
    ASSERT_TRUE(context.value(KEY_USERNAME).has_value());
    EXPECT_EQ(*context.value(KEY_USERNAME), "ada");
}

TEST(ContextTest, ParentIsUnchanged) {
    auto parent = Context{}.withValue("a", 1);
    auto child = parent.withValue("b", 2);

    EXPECT_TRUE(child.value("a").has_value());
    EXPECT_TRUE(child.value("b").has_value());
    EXPECT_FALSE(parent.value("b").has_value());
}

TEST(ContextTest, LaterValueShadowsEarlier) {
    auto context = Context{}.withValue("k", "old").withValue("k", "new");
    EXPECT_EQ(*context.value("k"), "new");
}

TEST(ContextTest, NullValueCountsAsAbsent) {
    auto context = Context{}.withValue("k", "set").withValue("k", nullptr);
    EXPECT_FALSE(context.value("k").has_value());
}

TEST(ContextTest, StructuredValues) {
    auto context =
        Context{}.withValue(std::string(KEY_WATCHER_NAME),
                            nlohmann::json{{"name", "w1"}, {"shard", 3}});
    auto value = context.value(KEY_WATCHER_NAME);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["shard"], 3);
}

TEST(ContextTest, SharedAcrossThreads) {
    auto context = Context{}.withValue(std::string(KEY_REQUEST_ID), "r-1");
    std::thread worker([context] {
        auto derived = context.withValue("step", "worker");
        EXPECT_EQ(*derived.value(KEY_REQUEST_ID), "r-1");
    });
    worker.join();
    EXPECT_FALSE(context.value("step").has_value());
}
