/*
 * Server configuration - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/fs/limits.hpp>
#include <istream>
#include <string>
#include <vector>

namespace toolbox {

struct ServerConfig {
    std::string shell = "/bin/bash";
    std::string rg_path = "rg";
    long default_timeout_ms = 120000;
    long max_timeout_ms = 600000;
    long kill_grace_ms = 100;
    Limits limits;
    bool debug = false;
};

// ~/.mcp-toolboxrc, or "" when HOME is unset.
std::string default_config_path();

// key=value lines; '#' comments and unknown keys are skipped, a value that
// does not parse leaves the default in place.
void apply_config_stream(std::istream& in, ServerConfig& cfg);

// false only if the file exists but cannot be opened.
bool load_config_file(const std::string& path, ServerConfig& cfg, std::string& error, bool must_exist = false);

enum class CliAction { Run, Help, Version, Error };

struct CliOptions {
    CliAction action = CliAction::Run;
    std::string config_path;
    bool debug = false;
    std::string error;
};

CliOptions parse_args(const std::vector<std::string>& args);

std::string usage_text(const std::string& prog);

} // namespace toolbox
