/**
 * line_buffer_test.cpp - LineSplitter and LineChannel tests
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "agent/line_channel.hpp"
#include "agent/line_splitter.hpp"

using namespace agentgate::agent;

TEST(LineSplitterTest, SplitsCompleteLines) {
    LineSplitter splitter;
    auto lines = splitter.feed("one\ntwo\n");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(splitter.pending_size(), 0u);
}

TEST(LineSplitterTest, HoldsPartialLineUntilNewline) {
    LineSplitter splitter;

    EXPECT_TRUE(splitter.feed("{\"type\":\"assis").empty());
    EXPECT_GT(splitter.pending_size(), 0u);

    auto lines = splitter.feed("tant\"}\n{\"type\"");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"type\":\"assistant\"}");

    auto tail = splitter.flush();
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0], "{\"type\"");
    EXPECT_EQ(splitter.pending_size(), 0u);
}

TEST(LineSplitterTest, TrimsAndDropsBlankLines) {
    LineSplitter splitter;
    auto lines = splitter.feed("  padded \r\n\n   \n\tlast\n");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "padded");
    EXPECT_EQ(lines[1], "last");
    EXPECT_TRUE(splitter.flush().empty());
}

TEST(LineChannelTest, DeliversInOrderThenClosed) {
    LineChannel channel;
    channel.push("a");
    channel.push("b");
    channel.close();

    std::string line;
    EXPECT_EQ(channel.pop(line, 0), LineChannel::PopStatus::LINE);
    EXPECT_EQ(line, "a");
    EXPECT_EQ(channel.pop(line, 0), LineChannel::PopStatus::LINE);
    EXPECT_EQ(line, "b");
    EXPECT_EQ(channel.pop(line, 0), LineChannel::PopStatus::CLOSED);
}

TEST(LineChannelTest, EmptyWhenNothingQueued) {
    LineChannel channel;
    std::string line;

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(channel.pop(line, 50), LineChannel::PopStatus::EMPTY);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST(LineChannelTest, FirstCloseWins) {
    LineChannel channel;

    EXPECT_TRUE(channel.close_with_error("boom"));
    EXPECT_FALSE(channel.close());
    EXPECT_FALSE(channel.close_with_error("other"));
    EXPECT_FALSE(channel.push("late"));

    std::string line;
    EXPECT_EQ(channel.pop(line, 0), LineChannel::PopStatus::FAILED);
    EXPECT_EQ(channel.error().value_or(""), "boom");
}

TEST(LineChannelTest, BlockingPopWakesOnPush) {
    LineChannel channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        channel.push("late line");
    });

    std::string line;
    EXPECT_EQ(channel.pop(line, -1), LineChannel::PopStatus::LINE);
    EXPECT_EQ(line, "late line");
    producer.join();
}

TEST(LineChannelTest, ClearDropsQueuedLines) {
    LineChannel channel;
    channel.push("x");
    channel.push("y");
    EXPECT_EQ(channel.size(), 2u);

    channel.clear();
    EXPECT_EQ(channel.size(), 0u);
}
