#include <gtest/gtest.h>
#include "line_reader.hpp"

#include <unistd.h>

#include <thread>

using namespace tether;
using namespace std::chrono_literals;

class LineReaderTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(::pipe(fds), 0); }

    void TearDown() override {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }

    void write_all(const std::string& data) {
        ASSERT_EQ(::write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_writer() {
        ::close(fds[1]);
        fds[1] = -1;
    }

    int fds[2] = {-1, -1};
    std::atomic<bool> stop{false};
};

TEST_F(LineReaderTest, SplitsLinesAndKeepsTrailingPartial) {
    LineReader reader(fds[0], 10ms);
    write_all("first\nsecond\nlast");
    close_writer();

    std::string line;
    ASSERT_TRUE(reader.next(line, stop));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(reader.next(line, stop));
    EXPECT_EQ(line, "second");
    ASSERT_TRUE(reader.next(line, stop));
    EXPECT_EQ(line, "last");
    EXPECT_FALSE(reader.next(line, stop));
}

TEST_F(LineReaderTest, LineSplitAcrossWrites) {
    LineReader reader(fds[0], 10ms);
    write_all("hel");
    std::thread writer([this] {
        std::this_thread::sleep_for(30ms);
        write_all("lo\n");
    });

    std::string line;
    EXPECT_TRUE(reader.next(line, stop));
    EXPECT_EQ(line, "hello");
    writer.join();
}

// The writer stays open and silent; only the stop flag can end the wait.
TEST_F(LineReaderTest, StopEndsAnIdleWait) {
    LineReader reader(fds[0], 10ms);
    bool result = true;
    std::thread reading([&] {
        std::string line;
        result = reader.next(line, stop);
    });

    std::this_thread::sleep_for(30ms);
    stop = true;
    reading.join();
    EXPECT_FALSE(result);
}

TEST_F(LineReaderTest, StopWinsOverBufferedInput) {
    LineReader reader(fds[0], 10ms);
    write_all("queued\n");
    stop = true;

    std::string line;
    EXPECT_FALSE(reader.next(line, stop));
}
