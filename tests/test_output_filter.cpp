#include <gtest/gtest.h>
#include <mcp-toolbox/exec/output_filter.hpp>
#include <re2/re2.h>
#include <thread>

using namespace toolbox;

TEST(OutputFilter, EmptyPatternIsNoFilter) {
    std::string err;
    EXPECT_FALSE(compile_filter("", err));
    EXPECT_TRUE(err.empty());
}

TEST(OutputFilter, InvalidPatternReportsError) {
    std::string err;
    EXPECT_FALSE(compile_filter("([", err));
    EXPECT_NE(err.find("Invalid filter regex"), std::string::npos);
}

TEST(OutputFilter, MatchAllIsIdentity) {
    std::string err;
    auto re = compile_filter(".*", err);
    ASSERT_TRUE(re);
    for (std::string text : {"a\nb\n", "a\nb", "\n", "one line", "x\n\ny\n"}) {
        EXPECT_EQ(filter_lines(text, *re), text);
    }
}

TEST(OutputFilter, MatchNoneIsEmpty) {
    std::string err;
    auto re = compile_filter("zzz_never", err);
    ASSERT_TRUE(re);
    EXPECT_EQ(filter_lines("a\nb\n", *re), "");
    EXPECT_EQ(filter_lines("a", *re), "");
}

TEST(OutputFilter, WholeLineMustMatch) {
    std::string err;
    auto re = compile_filter("err.*", err);
    ASSERT_TRUE(re);
    EXPECT_EQ(filter_lines("error: x\nok\nan error\nerr\n", *re), "error: x\nerr\n");
}

TEST(OutputFilter, NoTrailingNewlineAddedWhenAbsent) {
    std::string err;
    auto re = compile_filter("b", err);
    ASSERT_TRUE(re);
    EXPECT_EQ(filter_lines("a\nb", *re), "b");
}

TEST(OutputFilter, VeryLongLineDoesNotExhaustStack) {
    std::string err;
    auto re = compile_filter(".*", err);
    ASSERT_TRUE(re);
    std::string line(200000, 'a');
    std::string out;
    // Worker threads get a smaller stack than main.
    std::thread t([&] { out = filter_lines(line + "\nb\n", *re); });
    t.join();
    EXPECT_EQ(out, line + "\nb\n");
}

TEST(OutputFilter, GoStyleSyntax) {
    std::string err;
    auto re = compile_filter("(?i)warn\\w*", err);
    ASSERT_TRUE(re) << err;
    EXPECT_EQ(filter_lines("WARNING\nok\nwarn\n", *re), "WARNING\nwarn\n");
}
