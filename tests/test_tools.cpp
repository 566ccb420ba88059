#include <gtest/gtest.h>
#include <mcp-toolbox/tools/tools.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace toolbox;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static json::Value args_of(const std::string& text) {
    std::string err;
    auto v = json::parse(text, err);
    EXPECT_TRUE(v.has_value()) << err;
    return v ? *v : json::Value::object();
}

static json::Value parse_output(const ToolResult& r) {
    std::string err;
    auto v = json::parse(r.text, err);
    EXPECT_TRUE(v.has_value()) << r.text;
    return v ? *v : json::Value::object();
}

class ToolsTest : public ::testing::Test {
protected:
    ToolsTest() : ctx(make_config()) {}
    static ServerConfig make_config() {
        ServerConfig c;
        c.kill_grace_ms = 20;
        return c;
    }
    ToolContext ctx;
};

TEST_F(ToolsTest, DefinitionsCoverEveryTool) {
    std::vector<std::string> names;
    for (auto& d : tool_definitions()) {
        names.push_back(d.name);
        EXPECT_TRUE(d.input_schema.is_object());
        EXPECT_EQ(d.input_schema.find("type")->as_string(), "object");
        EXPECT_TRUE(static_cast<bool>(d.handler));
    }
    EXPECT_EQ(names, std::vector<std::string>({"bash", "bash_output", "list_shells", "kill_shell",
                                               "read", "write", "edit", "glob", "grep"}));
    EXPECT_NE(find_tool("grep"), nullptr);
    EXPECT_EQ(find_tool("nope"), nullptr);
}

TEST_F(ToolsTest, BashForeground) {
    ToolResult r = bash_tool(ctx, args_of(R"({"command":"echo hi"})"));
    ASSERT_TRUE(r.ok) << r.text;
    EXPECT_EQ(r.text, "hi\n");
}

TEST_F(ToolsTest, BashValidation) {
    ToolResult empty = bash_tool(ctx, args_of(R"({"command":"  "})"));
    EXPECT_FALSE(empty.ok);
    EXPECT_EQ(empty.text, "Command cannot be empty.");

    ToolResult too_long = bash_tool(ctx, args_of(R"({"command":"true","timeout":600001})"));
    EXPECT_FALSE(too_long.ok);
    EXPECT_EQ(too_long.text, "Timeout cannot exceed 600000 milliseconds (10 minutes).");

    ToolResult wrong_type = bash_tool(ctx, args_of(R"({"command":5})"));
    EXPECT_FALSE(wrong_type.ok);
    EXPECT_EQ(wrong_type.kind, ErrorKind::InvalidInput);
}

TEST_F(ToolsTest, BashErrors) {
    ToolResult exit3 = bash_tool(ctx, args_of(R"({"command":"echo bad; exit 3"})"));
    EXPECT_FALSE(exit3.ok);
    EXPECT_EQ(exit3.text, "Command exited with code 3:\nbad\n\n\nCommand: echo bad; exit 3");

    ToolResult slow = bash_tool(ctx, args_of(R"({"command":"sleep 5","timeout":200})"));
    EXPECT_FALSE(slow.ok);
    EXPECT_EQ(slow.kind, ErrorKind::Timeout);
    EXPECT_NE(slow.text.find("timed out"), std::string::npos);
}

TEST_F(ToolsTest, BackgroundLifecycle) {
    ToolResult start = bash_tool(ctx, args_of(R"({"command":"echo A; sleep 30","description":"waiter","run_in_background":true})"));
    ASSERT_TRUE(start.ok) << start.text;
    EXPECT_EQ(start.text, "Command running in background with ID: shell_1");

    auto h = ctx.registry.lookup("shell_1");
    ASSERT_NE(h, nullptr);
    for (int i = 0; i < 400 && h->stdout_sink().size() < 2; ++i) std::this_thread::sleep_for(5ms);

    json::Value polled = parse_output(bash_output_tool(ctx, args_of(R"({"shell_id":"shell_1"})")));
    EXPECT_EQ(polled.find("status")->as_string(), "running");
    EXPECT_EQ(polled.find("stdout")->as_string(), "A\n");
    EXPECT_FALSE(polled.contains("exit_code"));
    EXPECT_TRUE(polled.contains("timestamp"));

    json::Value listed = parse_output(list_shells_tool(ctx, json::Value::object()));
    EXPECT_EQ(listed.find("count")->as_int(), 1);
    EXPECT_EQ(listed.find("shells")->items()[0].find("description")->as_string(), "waiter");

    ToolResult killed = kill_shell_tool(ctx, args_of(R"({"shell_id":"shell_1"})"));
    ASSERT_TRUE(killed.ok) << killed.text;
    EXPECT_EQ(killed.text, "Successfully killed shell: shell_1 (echo A; sleep 30)");

    ToolResult again = kill_shell_tool(ctx, args_of(R"({"shell_id":"shell_1"})"));
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.kind, ErrorKind::NotFound);

    ToolResult none = list_shells_tool(ctx, json::Value::object());
    EXPECT_EQ(none.text, "No background shells are currently running.");
}

TEST_F(ToolsTest, BashOutputAfterCompletion) {
    ASSERT_TRUE(bash_tool(ctx, args_of(R"({"command":"echo done; echo warn 1>&2; exit 2","run_in_background":true})")).ok);
    auto h = ctx.registry.lookup("shell_1");
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->wait_for(3000ms));
    json::Value polled = parse_output(bash_output_tool(ctx, args_of(R"({"shell_id":"shell_1"})")));
    EXPECT_EQ(polled.find("status")->as_string(), "failed");
    EXPECT_EQ(polled.find("exit_code")->as_int(), 2);
    EXPECT_EQ(polled.find("stdout")->as_string(), "done\n");
    EXPECT_EQ(polled.find("stderr")->as_string(), "warn\n");

    ToolResult killed = kill_shell_tool(ctx, args_of(R"({"shell_id":"shell_1"})"));
    EXPECT_FALSE(killed.ok);
    EXPECT_EQ(killed.kind, ErrorKind::Conflict);
}

TEST_F(ToolsTest, MissingIds) {
    EXPECT_EQ(bash_output_tool(ctx, json::Value::object()).text, "shell_id is required.");
    EXPECT_EQ(kill_shell_tool(ctx, json::Value::object()).text, "shell_id is required.");
    ToolResult missing = bash_output_tool(ctx, args_of(R"({"shell_id":"shell_9"})"));
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
}

TEST_F(ToolsTest, FileToolsThroughArguments) {
    fs::path dir = fs::temp_directory_path() / ("mcp_toolbox_tools_" + std::to_string(getpid()));
    fs::remove_all(dir);
    std::string file = (dir / "f.txt").string();

    json::Value w = json::Value::object();
    w["file_path"] = file;
    w["content"] = "a\nb\n";
    ToolResult created = write_tool(ctx, w);
    ASSERT_TRUE(created.ok) << created.text;

    json::Value r = json::Value::object();
    r["file_path"] = file;
    ToolResult listing = read_tool(ctx, r);
    ASSERT_TRUE(listing.ok);
    EXPECT_EQ(listing.text, "     1→a\n     2→b");

    json::Value e = json::Value::object();
    e["file_path"] = file;
    e["old_string"] = "b";
    e["new_string"] = "c";
    ToolResult edited = edit_tool(ctx, e);
    ASSERT_TRUE(edited.ok) << edited.text;

    json::Value g = json::Value::object();
    g["pattern"] = "*.txt";
    g["path"] = dir.string();
    EXPECT_EQ(glob_tool(ctx, g).text, file);

    fs::remove_all(dir);
}

TEST_F(ToolsTest, HugeNumbersHitRangeChecks) {
    ToolResult huge_timeout = bash_tool(ctx, args_of(R"({"command":"true","timeout":1e300})"));
    EXPECT_FALSE(huge_timeout.ok);
    EXPECT_EQ(huge_timeout.text, "Timeout cannot exceed 600000 milliseconds (10 minutes).");

    ToolResult very_negative = bash_tool(ctx, args_of(R"({"command":"true","timeout":-1e300})"));
    EXPECT_FALSE(very_negative.ok);
    EXPECT_EQ(very_negative.text, "Timeout must not be negative.");

    fs::path dir = fs::temp_directory_path() / ("mcp_toolbox_ranges_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::string file = (dir / "abc.txt").string();
    std::ofstream(file) << "a\nb\nc\n";

    json::Value r = json::Value::object();
    r["file_path"] = file;
    r["offset"] = 2;
    r["limit"] = 2147483647;
    ToolResult wide = read_tool(ctx, r);
    ASSERT_TRUE(wide.ok) << wide.text;
    EXPECT_EQ(wide.text, "     2→b\n     3→c");

    r["offset"] = 4294967298.0;
    r["limit"] = 2;
    ToolResult far = read_tool(ctx, r);
    ASSERT_TRUE(far.ok) << far.text;
    EXPECT_NE(far.text.find("shorter than the provided offset (4294967298)"), std::string::npos) << far.text;
    EXPECT_EQ(far.text.find("→"), std::string::npos);

    r["offset"] = 1e300;
    ToolResult farther = read_tool(ctx, r);
    ASSERT_TRUE(farther.ok) << farther.text;
    EXPECT_NE(farther.text.find("shorter than the provided offset"), std::string::npos);

    fs::remove_all(dir);
}

TEST_F(ToolsTest, InvalidUtf8OutputStaysValidJson) {
    ASSERT_TRUE(bash_tool(ctx, args_of(R"({"command":"printf 'ok\\377\\n'","run_in_background":true})")).ok);
    auto h = ctx.registry.lookup("shell_1");
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->wait_for(3000ms));
    ToolResult polled = bash_output_tool(ctx, args_of(R"({"shell_id":"shell_1"})"));
    ASSERT_TRUE(polled.ok) << polled.text;
    EXPECT_EQ(polled.text.find('\xff'), std::string::npos);
    json::Value v = parse_output(polled);
    EXPECT_EQ(v.find("stdout")->as_string(), "ok\xEF\xBF\xBD\n");
}

TEST(Timestamp, Rfc3339WithNanoseconds) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)) + std::chrono::nanoseconds(5);
    std::string ts = format_timestamp(tp);
    EXPECT_EQ(ts.substr(0, 20), "2023-11-14T22:13:20.");
    EXPECT_EQ(ts.back(), 'Z');
    EXPECT_EQ(ts.size(), std::string("2023-11-14T22:13:20.000000005Z").size());
}
