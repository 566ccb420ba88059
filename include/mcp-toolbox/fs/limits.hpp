/*
 * Output and size limits - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace toolbox {

struct Limits {
    size_t max_file_bytes = 10 * 1024 * 1024;
    size_t max_output_chars = 25000 * 4; // ~25k tokens at 4 chars/token
    size_t max_result_lines = 1000;
};

// Error message if a file of `size` bytes may not be loaded.
std::optional<std::string> check_file_size(size_t size, const Limits& lim = {});

// Error message (with a hint chosen by tool name) if output is too large.
std::optional<std::string> check_output_size(const std::string& output, const std::string& tool, const Limits& lim = {});

// Keep at most max_result_lines lines, cutting right after the N-th newline.
std::string limit_lines(const std::string& s, const Limits& lim = {});

} // namespace toolbox
