/*
 * Line filter implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/output_filter.hpp>
#include <re2/re2.h>

namespace toolbox {

std::unique_ptr<re2::RE2> compile_filter(const std::string& pattern, std::string& error) {
    if (pattern.empty()) return nullptr;
    re2::RE2::Options opts;
    opts.set_log_errors(false);
    auto re = std::make_unique<re2::RE2>(pattern, opts);
    if (!re->ok()) {
        error = "Invalid filter regex: " + re->error();
        return nullptr;
    }
    return re;
}

std::string filter_lines(const std::string& text, const re2::RE2& re) {
    if (text.empty()) return text;
    bool trailing_newline = text.back() == '\n';
    size_t body_len = trailing_newline ? text.size() - 1 : text.size();
    std::string out;
    size_t kept = 0;
    size_t start = 0;
    while (start <= body_len) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos || nl > body_len) nl = body_len;
        re2::StringPiece line(text.data() + start, nl - start);
        if (re2::RE2::FullMatch(line, re)) {
            if (kept++ > 0) out.push_back('\n');
            out.append(line.data(), line.size());
        }
        start = nl + 1;
    }
    if (trailing_newline && kept > 0) out.push_back('\n');
    return out;
}

} // namespace toolbox
