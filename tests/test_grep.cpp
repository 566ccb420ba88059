#include <gtest/gtest.h>
#include <mcp-toolbox/search/grep.hpp>

using namespace toolbox;

TEST(GrepArgs, DefaultListsMatchingFiles) {
    GrepOptions o;
    o.pattern = "TODO";
    auto args = build_ripgrep_args(o);
    EXPECT_EQ(args, std::vector<std::string>({"--files-with-matches", "--", "TODO"}));
}

TEST(GrepArgs, ContentModeWithContextAndFilters) {
    GrepOptions o;
    o.pattern = "-starts-with-dash";
    o.path = "/src";
    o.output_mode = "content";
    o.after = 1;
    o.before = 2;
    o.context = 3;
    o.line_numbers = true;
    o.ignore_case = true;
    o.multiline = true;
    o.type = "cpp";
    o.glob = "*.hpp";
    auto args = build_ripgrep_args(o);
    EXPECT_EQ(args, std::vector<std::string>({"-A", "1", "-B", "2", "-C", "3", "--line-number", "--ignore-case",
                                              "--multiline", "--multiline-dotall", "--type", "cpp", "--glob", "*.hpp",
                                              "--", "-starts-with-dash", "/src"}));
}

TEST(GrepArgs, CountModeIgnoresContextFlags) {
    GrepOptions o;
    o.pattern = "x";
    o.output_mode = "count";
    o.after = 4;
    o.line_numbers = true;
    auto args = build_ripgrep_args(o);
    EXPECT_EQ(args, std::vector<std::string>({"--count", "--", "x"}));
}

TEST(GrepHeadLimit, KeepsFirstLines) {
    EXPECT_EQ(apply_head_limit("a\nb\nc\n", 2), "a\nb\n");
    EXPECT_EQ(apply_head_limit("a\nb", 5), "a\nb");
    EXPECT_EQ(apply_head_limit("a\nb\n", 0), "a\nb\n");
}

TEST(GrepSearch, RejectsBadOutputMode) {
    GrepOptions o;
    o.pattern = "x";
    o.output_mode = "lines";
    ToolResult r = grep_search(o, "rg");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.text, "Invalid output_mode: lines. Must be one of: content, files_with_matches, count.");
}

TEST(GrepSearch, MissingBinaryIsReported) {
    GrepOptions o;
    o.pattern = "x";
    ToolResult r = grep_search(o, "/nonexistent/rg");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::System);
    EXPECT_EQ(r.text.rfind("Failed to execute rg", 0), 0u);
}

TEST(GrepSearch, EmptyPatternRejected) {
    GrepOptions o;
    ToolResult r = grep_search(o, "rg");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}
