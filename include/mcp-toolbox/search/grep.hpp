/*
 * Content search through ripgrep - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/fs/limits.hpp>
#include <mcp-toolbox/tools/result.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace toolbox {

struct GrepOptions {
    std::string pattern;
    std::string path;        // file or directory; empty = working directory
    std::string glob;        // --glob filter
    std::string type;        // --type filter
    std::string output_mode = "files_with_matches"; // content | files_with_matches | count
    int after = 0;           // -A (content mode)
    int before = 0;          // -B
    int context = 0;         // -C
    bool line_numbers = false;
    bool ignore_case = false;
    bool multiline = false;
    int head_limit = 0;      // 0 = unlimited
};

bool valid_output_mode(const std::string& mode);

// argv for rg, without the executable itself.
std::vector<std::string> build_ripgrep_args(const GrepOptions& opts);

// First `limit` lines of `text`; 0 keeps everything.
std::string apply_head_limit(const std::string& text, int limit);

ToolResult grep_search(const GrepOptions& opts, const std::string& rg_path, const Limits& lim = {},
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(120000));

} // namespace toolbox
