/*
 * Path and listing helpers implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/fs/text.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace toolbox {
namespace fs = std::filesystem;

static const size_t kMaxLineChars = 2000;

std::optional<std::string> resolve_path(const std::string& file_path, std::string& error) {
    fs::path p(file_path);
    if (file_path.empty() || !p.is_absolute()) {
        error = "file path must be absolute, not relative";
        return std::nullopt;
    }
    std::string out = p.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) { lines.push_back(s.substr(start)); break; }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i < last && i < lines.size(); ++i) {
        if (i > first) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string cat_n(const std::vector<std::string>& lines, size_t first, size_t last, int start_line) {
    last = std::min(last, lines.size());
    if (first >= last) return "";
    int width = std::max<int>(6, static_cast<int>(std::to_string(start_line + (last - first)).size()));
    std::string out;
    char num[32];
    for (size_t i = first; i < last; ++i) {
        if (i > first) out.push_back('\n');
        std::snprintf(num, sizeof(num), "%*d", width, start_line + static_cast<int>(i - first));
        out += num;
        out += "→";
        const std::string& line = lines[i];
        out.append(line, 0, std::min(line.size(), kMaxLineChars));
    }
    return out;
}

std::pair<int, int> modified_lines(const std::vector<std::string>& old_lines,
                                   const std::vector<std::string>& new_lines, int delta) {
    if (delta < 0) delta = 0;
    const int n_old = static_cast<int>(old_lines.size());
    const int n_new = static_cast<int>(new_lines.size());
    int i = 0;
    while (i < n_old && i < n_new && old_lines[i] == new_lines[i]) ++i;
    int j = 0;
    while (n_old - 1 - j >= i && n_new - 1 - j >= i && old_lines[n_old - 1 - j] == new_lines[n_new - 1 - j]) ++j;
    int start = std::max(1, i + 1 - delta);
    int end = std::min(n_old, n_old - j + delta);
    return {start, end};
}

} // namespace toolbox
