#include <gtest/gtest.h>
#include <mcp-toolbox/config/config.hpp>
#include <sstream>

using namespace toolbox;

TEST(Config, Defaults) {
    ServerConfig c;
    EXPECT_EQ(c.shell, "/bin/bash");
    EXPECT_EQ(c.rg_path, "rg");
    EXPECT_EQ(c.default_timeout_ms, 120000);
    EXPECT_EQ(c.max_timeout_ms, 600000);
    EXPECT_EQ(c.kill_grace_ms, 100);
    EXPECT_EQ(c.limits.max_output_chars, 100000u);
    EXPECT_EQ(c.limits.max_file_bytes, 10485760u);
    EXPECT_EQ(c.limits.max_result_lines, 1000u);
    EXPECT_FALSE(c.debug);
}

TEST(Config, RcFileOverrides) {
    std::istringstream in(
        "# comment\n"
        "shell=/bin/sh\n"
        " rg_path = /usr/local/bin/rg \n"
        "default_timeout_ms=5000\n"
        "max_result_lines=50\n"
        "kill_grace_ms=abc\n"
        "unknown_key=1\n"
        "no equals sign\n"
        "debug=on\n");
    ServerConfig c;
    apply_config_stream(in, c);
    EXPECT_EQ(c.shell, "/bin/sh");
    EXPECT_EQ(c.rg_path, "/usr/local/bin/rg");
    EXPECT_EQ(c.default_timeout_ms, 5000);
    EXPECT_EQ(c.limits.max_result_lines, 50u);
    EXPECT_EQ(c.kill_grace_ms, 100);
    EXPECT_TRUE(c.debug);
}

TEST(Config, DefaultTimeoutClampedToMax) {
    std::istringstream in("max_timeout_ms=1000\ndefault_timeout_ms=9000\n");
    ServerConfig c;
    apply_config_stream(in, c);
    EXPECT_EQ(c.default_timeout_ms, 1000);
}

TEST(Config, MissingFileHandling) {
    ServerConfig c;
    std::string err;
    EXPECT_TRUE(load_config_file("/nonexistent/mcp-toolboxrc", c, err));
    EXPECT_FALSE(load_config_file("/nonexistent/mcp-toolboxrc", c, err, true));
    EXPECT_NE(err.find("/nonexistent/mcp-toolboxrc"), std::string::npos);
}

TEST(Config, ParseArgs) {
    auto o = parse_args({"-d", "--config", "/etc/toolbox.rc"});
    EXPECT_EQ(o.action, CliAction::Run);
    EXPECT_TRUE(o.debug);
    EXPECT_EQ(o.config_path, "/etc/toolbox.rc");

    EXPECT_EQ(parse_args({"--version"}).action, CliAction::Version);
    EXPECT_EQ(parse_args({"-h"}).action, CliAction::Help);
    EXPECT_EQ(parse_args({"--config"}).action, CliAction::Error);
    auto bad = parse_args({"--bogus"});
    EXPECT_EQ(bad.action, CliAction::Error);
    EXPECT_NE(bad.error.find("--bogus"), std::string::npos);
    EXPECT_EQ(parse_args({"--config=/x"}).config_path, "/x");
}
