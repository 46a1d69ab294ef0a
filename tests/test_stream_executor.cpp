#include <gtest/gtest.h>
#include <managers/stream_executor.hpp>
#include "mock_transport.hpp"

class StreamExecutorTest : public ::testing::Test {
protected:
    MockStats stats;
    MockHandle handle{"ev3dev", stats};
    StreamingExecutor executor{std::chrono::milliseconds(1)};

    OutputStream start() {
        auto r = executor.run(handle, "brickrun -r -- pybricks-micropython '/home/robot/x.py'");
        EXPECT_TRUE(r.is_ok()) << r.error;
        return std::move(r.value);
    }
};

TEST_F(StreamExecutorTest, LinesThenEnd) {
    handle.script.reads = {LineRead::got("a"), LineRead::got("b")};
    auto stream = start();

    auto e1 = stream.next();
    EXPECT_EQ(e1.kind, StreamEvent::Kind::Line);
    EXPECT_EQ(e1.text, "a");
    auto e2 = stream.next();
    EXPECT_EQ(e2.kind, StreamEvent::Kind::Line);
    EXPECT_EQ(e2.text, "b");
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);

    EXPECT_TRUE(stream.finished());
    ASSERT_TRUE(stream.exit_status().has_value());
    EXPECT_EQ(*stream.exit_status(), 0);
    EXPECT_EQ(stats.process_releases.load(), 1);

    // Stays ended
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
}

TEST_F(StreamExecutorTest, TimeoutsKeepPollingUntilExit) {
    handle.script.reads = {LineRead::timeout(), LineRead::got("a"), LineRead::timeout()};
    handle.script.exit_code = 2;
    auto stream = start();

    auto e1 = stream.next();
    EXPECT_EQ(e1.kind, StreamEvent::Kind::Line);
    EXPECT_EQ(e1.text, "a");
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
    EXPECT_EQ(stream.exit_status().value_or(-1), 2);
}

TEST_F(StreamExecutorTest, DroppingStreamReleasesProcess) {
    handle.script.reads = {LineRead::got("a"), LineRead::got("b")};
    {
        auto stream = start();
        EXPECT_EQ(stream.next().text, "a");
        EXPECT_EQ(stats.process_releases.load(), 0);
    }
    EXPECT_EQ(stats.process_releases.load(), 1);
}

TEST_F(StreamExecutorTest, CloseStopsEarly) {
    handle.script.reads = {LineRead::got("a"), LineRead::got("b")};
    auto stream = start();
    EXPECT_EQ(stream.next().text, "a");

    stream.close();
    EXPECT_EQ(stats.process_releases.load(), 1);
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
    EXPECT_FALSE(stream.exit_status().has_value());

    stream.close();
    EXPECT_EQ(stats.process_releases.load(), 1);
}

TEST_F(StreamExecutorTest, CancelFlagEndsStream) {
    handle.script.reads = {LineRead::got("a"), LineRead::got("b")};
    std::atomic<bool> cancel{false};
    auto stream = start();
    stream.set_cancel_flag(&cancel);

    EXPECT_EQ(stream.next().text, "a");
    cancel = true;
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
    EXPECT_EQ(stats.process_releases.load(), 1);
}

TEST_F(StreamExecutorTest, ReadErrorIsTerminalErrorEvent) {
    handle.script.reads = {LineRead::got("a"), LineRead::failed("channel reset")};
    auto stream = start();

    EXPECT_EQ(stream.next().text, "a");
    auto err = stream.next();
    EXPECT_EQ(err.kind, StreamEvent::Kind::Error);
    EXPECT_EQ(err.text, "channel reset");
    EXPECT_EQ(stats.process_releases.load(), 1);
    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
}

TEST_F(StreamExecutorTest, SpawnFailureProducesNoStream) {
    handle.fail_spawn = true;
    auto r = executor.run(handle, "brickrun x");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProcessSpawn);
    EXPECT_EQ(stats.spawns.load(), 0);
}

TEST_F(StreamExecutorTest, DrainCollectsLinesAndExitStatus) {
    handle.script.reads = {LineRead::got("Traceback (most recent call last):"), LineRead::got("NameError")};
    handle.script.exit_code = 1;
    auto stream = start();

    std::vector<std::string> lines;
    auto r = stream.drain([&](const std::string& l) { lines.push_back(l); return true; });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 1);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "NameError");
}

TEST_F(StreamExecutorTest, DrainStopsWhenCallbackDeclines) {
    handle.script.reads = {LineRead::got("a"), LineRead::got("b"), LineRead::got("c")};
    auto stream = start();

    int seen = 0;
    auto r = stream.drain([&](const std::string&) { return ++seen < 2; });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, -1);
    EXPECT_EQ(seen, 2);
    EXPECT_EQ(stats.process_releases.load(), 1);
}

TEST_F(StreamExecutorTest, DrainReportsStreamError) {
    handle.script.reads = {LineRead::failed("socket closed")};
    auto stream = start();

    auto r = stream.drain(nullptr);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::StreamRead);
    EXPECT_EQ(r.error, "socket closed");
}

TEST_F(StreamExecutorTest, MovedFromStreamIsInert) {
    handle.script.reads = {LineRead::got("a")};
    auto stream = start();
    OutputStream other = std::move(stream);

    EXPECT_EQ(stream.next().kind, StreamEvent::Kind::End);
    EXPECT_EQ(stats.process_releases.load(), 0);
    EXPECT_EQ(other.next().text, "a");
}
