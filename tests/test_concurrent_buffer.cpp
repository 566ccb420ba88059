#include <gtest/gtest.h>
#include <mcp-toolbox/exec/concurrent_buffer.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace toolbox;

TEST(ConcurrentBuffer, AppendAndReadRange) {
    ConcurrentBuffer b;
    b.append(std::string("hello "));
    b.append("world", 5);
    EXPECT_EQ(b.size(), 11u);
    EXPECT_EQ(b.read_range(0, 5), "hello");
    EXPECT_EQ(b.read_range(6, 11), "world");
    EXPECT_EQ(b.str(), "hello world");
}

TEST(ConcurrentBuffer, RangeIsClamped) {
    ConcurrentBuffer b;
    b.append(std::string("abc"));
    EXPECT_EQ(b.read_range(1, 100), "bc");
    EXPECT_EQ(b.read_range(3, 10), "");
    EXPECT_EQ(b.read_range(5, 2), "");
}

TEST(ConcurrentBuffer, ReadersSeeStablePrefixWhileWriting) {
    ConcurrentBuffer b;
    std::string expected;
    for (int i = 0; i < 2000; ++i) expected += std::to_string(i) + '\n';
    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                size_t n = b.size();
                std::string got = b.read_range(0, n);
                if (got != expected.substr(0, got.size())) ++bad;
            }
        });
    }
    for (int i = 0; i < 2000; ++i) b.append(std::to_string(i) + '\n');
    stop = true;
    for (auto& t : readers) t.join();
    EXPECT_EQ(bad.load(), 0);
    EXPECT_EQ(b.str(), expected);
}
