/*
 * Output and size limits implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/fs/limits.hpp>
#include <map>

namespace toolbox {

std::optional<std::string> check_file_size(size_t size, const Limits& lim) {
    if (size <= lim.max_file_bytes) return std::nullopt;
    return "File content (" + std::to_string(size) + " bytes) exceeds maximum allowed size (" +
           std::to_string(lim.max_file_bytes) +
           " bytes). Please use offset and limit parameters to read specific portions of the file, "
           "or use the Grep tool to search for specific content.";
}

static const std::map<std::string, std::string>& output_hints() {
    static const std::map<std::string, std::string> hints = {
        {"read", "Use the offset and limit parameters to read specific portions of the file, or use the Grep tool to search for specific content."},
        {"write", "Consider breaking the file into smaller chunks."},
        {"edit", "Consider editing smaller sections of the file."},
        {"grep", "Consider using the head_limit parameter to restrict results, adding more specific patterns, or using glob/type filters to narrow the search."},
        {"glob", "Consider using more specific glob patterns to narrow the search scope."},
        {"bash", "Consider using background execution with bash_output to stream results, or redirect output to a file and read specific portions."},
    };
    return hints;
}

std::optional<std::string> check_output_size(const std::string& output, const std::string& tool, const Limits& lim) {
    if (output.size() <= lim.max_output_chars) return std::nullopt;
    auto it = output_hints().find(tool);
    std::string hint = it != output_hints().end()
        ? it->second
        : "Consider breaking down the operation into smaller parts or using more specific parameters to limit output.";
    return "Output (" + std::to_string(output.size() / 4) + " tokens) exceeds maximum allowed size (" +
           std::to_string(lim.max_output_chars / 4) + " tokens). " + hint;
}

std::string limit_lines(const std::string& s, const Limits& lim) {
    if (s.empty() || lim.max_result_lines == 0) return s;
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n' && ++count >= lim.max_result_lines) return s.substr(0, i + 1);
    }
    return s;
}

} // namespace toolbox
