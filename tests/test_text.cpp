#include <gtest/gtest.h>
#include <mcp-toolbox/fs/text.hpp>

using namespace toolbox;

TEST(Text, ResolvePathNormalises) {
    std::string err;
    auto p = resolve_path("/tmp/a/../b/./c.txt", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, "/tmp/b/c.txt");
    EXPECT_EQ(*resolve_path("/tmp/dir/", err), "/tmp/dir");
    EXPECT_EQ(*resolve_path("/", err), "/");
}

TEST(Text, ResolvePathRejectsRelative) {
    std::string err;
    EXPECT_FALSE(resolve_path("rel/file", err).has_value());
    EXPECT_NE(err.find("absolute"), std::string::npos);
    err.clear();
    EXPECT_FALSE(resolve_path("", err).has_value());
    EXPECT_FALSE(err.empty());
}

TEST(Text, SplitLines) {
    EXPECT_EQ(split_lines(""), std::vector<std::string>({""}));
    EXPECT_EQ(split_lines("a\n"), std::vector<std::string>({"a", ""}));
    EXPECT_EQ(split_lines("a\nb"), std::vector<std::string>({"a", "b"}));
    EXPECT_EQ(join_lines({"a", "b", "c"}, 0, 3), "a\nb\nc");
    EXPECT_EQ(join_lines({"a", "b", "c"}, 1, 10), "b\nc");
}

TEST(Text, CatNumbersLines) {
    std::vector<std::string> lines{"alpha", "beta", "gamma"};
    EXPECT_EQ(cat_n(lines, 1, 3, 2), "     2→beta\n     3→gamma");
    EXPECT_EQ(cat_n(lines, 3, 3, 4), "");
}

TEST(Text, CatCutsLongLines) {
    std::vector<std::string> lines{std::string(2500, 'x')};
    std::string out = cat_n(lines, 0, 1, 1);
    EXPECT_EQ(out.size(), std::string("     1→").size() + 2000);
}

TEST(Text, ModifiedLinesWindow) {
    auto old_lines = split_lines("1\n2\n3\n4\n5\n6\n7\n8");
    auto new_lines = split_lines("1\n2\n3\nfour\n5\n6\n7\n8");
    auto [start, end] = modified_lines(old_lines, new_lines, 2);
    EXPECT_EQ(start, 2);
    EXPECT_EQ(end, 6);
    auto [s0, e0] = modified_lines(old_lines, new_lines, 0);
    EXPECT_EQ(s0, 4);
    EXPECT_EQ(e0, 4);
}
