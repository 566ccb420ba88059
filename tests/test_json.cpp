#include <gtest/gtest.h>
#include <mcp-toolbox/json/json.hpp>

using namespace toolbox;

TEST(Json, ParsesRequest) {
    std::string err;
    auto v = json::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"bash","arguments":{"command":"ls","run_in_background":true}}})", err);
    ASSERT_TRUE(v.has_value()) << err;
    EXPECT_EQ(v->find("id")->as_int(), 7);
    const json::Value* args = v->find("params")->find("arguments");
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->find("command")->as_string(), "ls");
    EXPECT_TRUE(args->find("run_in_background")->as_bool());
    EXPECT_EQ(args->find("missing"), nullptr);
}

TEST(Json, StringEscapes) {
    std::string err;
    auto v = json::parse(R"(["a\"b\\c\n\t", "\u00e9\u20ac", "\ud83d\ude00", "\/"])", err);
    ASSERT_TRUE(v.has_value()) << err;
    ASSERT_EQ(v->size(), 4u);
    EXPECT_EQ(v->items()[0].as_string(), "a\"b\\c\n\t");
    EXPECT_EQ(v->items()[1].as_string(), "\xc3\xa9\xe2\x82\xac");
    EXPECT_EQ(v->items()[2].as_string(), "\xf0\x9f\x98\x80");
    EXPECT_EQ(v->items()[3].as_string(), "/");
}

TEST(Json, NumbersAndLiterals) {
    std::string err;
    auto v = json::parse(" [0, -12, 3.5, 1e3, true, false, null] ", err);
    ASSERT_TRUE(v.has_value()) << err;
    EXPECT_EQ(v->items()[1].as_int(), -12);
    EXPECT_DOUBLE_EQ(v->items()[2].as_number(), 3.5);
    EXPECT_DOUBLE_EQ(v->items()[3].as_number(), 1000.0);
    EXPECT_TRUE(v->items()[6].is_null());
}

TEST(Json, RejectsMalformed) {
    std::string err;
    for (const char* bad : {"", "{", "{\"a\":}", "[1,]", "01", "\"unterminated", "{\"a\":1} x", "tru", "\"\\ud800\""}) {
        err.clear();
        EXPECT_FALSE(json::parse(bad, err).has_value()) << bad;
        EXPECT_FALSE(err.empty()) << bad;
    }
}

TEST(Json, DumpKeepsInsertionOrder) {
    json::Value v = json::Value::object();
    v["status"] = "running";
    v["exit_code"] = 0;
    v["ok"] = true;
    v["list"] = json::Value::array();
    v["list"].push_back(1.5);
    v["list"].push_back(nullptr);
    EXPECT_EQ(v.dump(), R"({"status":"running","exit_code":0,"ok":true,"list":[1.5,null]})");
}

TEST(Json, DumpEscapesControlCharacters) {
    json::Value v(std::string("a\"\n\x01"));
    EXPECT_EQ(v.dump(), "\"a\\\"\\n\\u0001\"");
}

TEST(Json, DumpReplacesInvalidUtf8) {
    EXPECT_EQ(json::escape("ok\xff"), "ok\\ufffd");
    // Well-formed multi-byte sequences pass through untouched.
    EXPECT_EQ(json::escape("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"), "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80");
    // A split character (cut by a poll cursor) becomes one replacement per byte.
    EXPECT_EQ(json::escape("x\xe2\x82"), "x\\ufffd\\ufffd");
    // Overlong encoding, surrogate, lone continuation byte.
    EXPECT_EQ(json::escape("\xc0\xaf"), "\\ufffd\\ufffd");
    EXPECT_EQ(json::escape("\xed\xa0\x80"), "\\ufffd\\ufffd\\ufffd");
    EXPECT_EQ(json::escape("\x80" "a"), "\\ufffda");

    json::Value v(std::string("ok\xff\n"));
    std::string err;
    auto back = json::parse(v.dump(), err);
    ASSERT_TRUE(back.has_value()) << err;
    EXPECT_EQ(back->as_string(), "ok\xef\xbf\xbd\n");
}
