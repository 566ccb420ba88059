/*
 * Path and listing helpers - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolbox {

// Absolute, lexically normalised path used as the canonical key for a file.
// Relative paths are refused (error filled, nullopt returned).
std::optional<std::string> resolve_path(const std::string& file_path, std::string& error);

// Split on '\n'; "a\n" gives {"a", ""} and "" gives {""}.
std::vector<std::string> split_lines(const std::string& s);

std::string join_lines(const std::vector<std::string>& lines, size_t first, size_t last);

// `cat -n` style listing of lines[first, last), numbered from start_line.
// Lines longer than 2000 characters are cut.
std::string cat_n(const std::vector<std::string>& lines, size_t first, size_t last, int start_line);

// 1-based inclusive range of old_lines that differ from new_lines, widened by
// `delta` lines of context and clamped to the old file.
std::pair<int, int> modified_lines(const std::vector<std::string>& old_lines,
                                   const std::vector<std::string>& new_lines, int delta);

} // namespace toolbox
