/*
 * File read/write/edit - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/fs/file_guard.hpp>
#include <mcp-toolbox/fs/limits.hpp>
#include <mcp-toolbox/tools/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace toolbox {

struct EditItem {
    std::string old_string;
    std::string new_string;
    bool replace_all = false;
};

// Line-oriented file access. Every read is recorded in the guard; every write
// or edit is checked against it first and re-recorded after success.
class FileTools {
public:
    FileTools(FileMutationGuard& guard, Limits limits = {}) : m_guard(guard), m_limits(limits) {}

    // offset is the 1-based first line, limit the line count; 0 means unset.
    ToolResult read(const std::string& file_path, long offset = 0, long limit = 0);
    ToolResult write(const std::string& file_path, const std::string& content);
    ToolResult edit(const std::string& file_path, const std::string& old_string,
                    const std::string& new_string, bool replace_all = false);
    // Edits apply in order; a later old_string may not match text an earlier edit inserted.
    ToolResult edit_many(const std::string& file_path, const std::vector<EditItem>& edits,
                         std::string* old_content = nullptr, std::string* new_content = nullptr);

private:
    FileMutationGuard& m_guard;
    Limits m_limits;
};

// 1-based inclusive line window for a read; 2000 lines when neither is given.
std::pair<long, long> calculate_line_range(long total_lines, long offset, long limit);

// Mime-ish label for content that should not be listed as text, or "" for text.
std::string detect_binary_type(const std::string& content);

} // namespace toolbox
