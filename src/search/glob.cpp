/*
 * File glob search implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/search/glob.hpp>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace toolbox {
namespace fs = std::filesystem;

std::string glob_to_regex(const std::string& pat) {
    std::string rx; rx.reserve(pat.size() * 2);
    rx += '^';
    bool in_class = false;
    int brace_depth = 0;
    for (size_t i = 0; i < pat.size(); ++i) {
        char c = pat[i];
        if (in_class) {
            if (c == ']') in_class = false;
            if (c == '\\') rx.push_back('\\');
            rx.push_back(c);
            continue;
        }
        switch (c) {
            case '*':
                if (i + 1 < pat.size() && pat[i + 1] == '*') {
                    bool at_seg_start = (i == 0 || pat[i - 1] == '/');
                    if (at_seg_start && i + 2 < pat.size() && pat[i + 2] == '/') {
                        rx += "(?:.*/)?"; // "**/" : zero or more directories
                        i += 2;
                    } else {
                        rx += ".*";
                        ++i;
                    }
                } else {
                    rx += "[^/]*";
                }
                break;
            case '?': rx += "[^/]"; break;
            case '[':
                in_class = true;
                rx.push_back('[');
                if (i + 1 < pat.size() && pat[i + 1] == '!') { rx.push_back('^'); ++i; }
                break;
            case '{': ++brace_depth; rx += "(?:"; break;
            case '}':
                if (brace_depth > 0) { --brace_depth; rx.push_back(')'); }
                else rx += "\\}";
                break;
            case ',':
                if (brace_depth > 0) rx.push_back('|'); else rx.push_back(',');
                break;
            case '.': case '(': case ')': case '+': case '^': case '$': case '|': case '\\': case ']':
                rx.push_back('\\'); rx.push_back(c); break;
            default: rx.push_back(c); break;
        }
    }
    rx += '$';
    return rx;
}

std::optional<std::vector<std::string>> find_matching_files(const std::string& root, const std::string& pattern,
                                                            std::string& error) {
    std::regex re;
    try {
        re = std::regex(glob_to_regex(pattern), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        error = "Invalid glob pattern: " + pattern + " (" + e.what() + ")";
        return std::nullopt;
    }

    std::vector<std::pair<fs::file_time_type, std::string>> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec) || fec) continue;
        std::string rel = fs::path(it->path()).lexically_relative(root).generic_string();
        if (!std::regex_match(rel, re)) continue;
        auto mtime = it->last_write_time(fec);
        if (fec) continue;
        found.emplace_back(mtime, it->path().string());
    }
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second < b.second;
    });
    std::vector<std::string> out;
    out.reserve(found.size());
    for (auto& f : found) out.push_back(std::move(f.second));
    return out;
}

ToolResult glob_files(const std::string& pattern, const std::string& path, const Limits& lim) {
    if (pattern.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "pattern is required.");
    if (pattern.find('\0') != std::string::npos) return ToolResult::failure(ErrorKind::InvalidInput, "Invalid glob pattern.");

    std::string root = path;
    if (root.empty()) {
        std::error_code ec;
        root = fs::current_path(ec).string();
        if (ec) return ToolResult::failure(ErrorKind::System, "Cannot determine working directory: " + ec.message());
    } else if (!fs::path(root).is_absolute()) {
        return ToolResult::failure(ErrorKind::InvalidInput, "path must be absolute, not relative: " + root);
    }
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return ToolResult::success("No files found");

    std::string err;
    auto files = find_matching_files(root, pattern, err);
    if (!files) return ToolResult::failure(ErrorKind::InvalidInput, err);
    if (files->empty()) return ToolResult::success("No files found");

    std::string out;
    for (auto& f : *files) { out += f; out.push_back('\n'); }
    out = limit_lines(out, lim);
    while (!out.empty() && out.back() == '\n') out.pop_back();
    if (auto too_big = check_output_size(out, "glob", lim)) return ToolResult::failure(ErrorKind::TooLarge, *too_big);
    return ToolResult::success(out);
}

} // namespace toolbox
