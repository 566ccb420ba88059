/*
 * File glob search - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/fs/limits.hpp>
#include <mcp-toolbox/tools/result.hpp>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace toolbox {

// Translate a glob into an anchored ECMAScript regex over '/'-separated
// relative paths. `*` and `?` stay inside one path segment, `**/` spans any
// number of directories, `[..]` and `{a,b}` are supported.
std::string glob_to_regex(const std::string& pattern);

// Regular files under `root` whose relative path matches, newest first.
// nullopt (error filled) when the pattern cannot be compiled.
std::optional<std::vector<std::string>> find_matching_files(const std::string& root, const std::string& pattern,
                                                            std::string& error);

// Tool entry point; `path` defaults to the current working directory.
ToolResult glob_files(const std::string& pattern, const std::string& path, const Limits& lim = {});

} // namespace toolbox
