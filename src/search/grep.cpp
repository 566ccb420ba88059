/*
 * Content search through ripgrep implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/search/grep.hpp>
#include <mcp-toolbox/exec/foreground.hpp>

namespace toolbox {

bool valid_output_mode(const std::string& mode) {
    return mode == "content" || mode == "files_with_matches" || mode == "count";
}

std::vector<std::string> build_ripgrep_args(const GrepOptions& opts) {
    std::vector<std::string> args;
    if (opts.output_mode == "files_with_matches") {
        args.push_back("--files-with-matches");
    } else if (opts.output_mode == "count") {
        args.push_back("--count");
    } else {
        if (opts.after > 0) { args.push_back("-A"); args.push_back(std::to_string(opts.after)); }
        if (opts.before > 0) { args.push_back("-B"); args.push_back(std::to_string(opts.before)); }
        if (opts.context > 0) { args.push_back("-C"); args.push_back(std::to_string(opts.context)); }
        if (opts.line_numbers) args.push_back("--line-number");
    }
    if (opts.ignore_case) args.push_back("--ignore-case");
    if (opts.multiline) { args.push_back("--multiline"); args.push_back("--multiline-dotall"); }
    if (!opts.type.empty()) { args.push_back("--type"); args.push_back(opts.type); }
    if (!opts.glob.empty()) { args.push_back("--glob"); args.push_back(opts.glob); }
    args.push_back("--");
    args.push_back(opts.pattern);
    if (!opts.path.empty()) args.push_back(opts.path);
    return args;
}

std::string apply_head_limit(const std::string& text, int limit) {
    if (limit <= 0) return text;
    size_t pos = 0;
    for (int n = 0; n < limit; ++n) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) return text;
        pos = nl + 1;
    }
    return text.substr(0, pos);
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

ToolResult grep_search(const GrepOptions& opts, const std::string& rg_path, const Limits& lim,
                       std::chrono::milliseconds timeout) {
    if (opts.pattern.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "pattern is required.");
    if (!valid_output_mode(opts.output_mode)) {
        return ToolResult::failure(ErrorKind::InvalidInput,
            "Invalid output_mode: " + opts.output_mode + ". Must be one of: content, files_with_matches, count.");
    }
    if (opts.after < 0 || opts.before < 0 || opts.context < 0 || opts.head_limit < 0)
        return ToolResult::failure(ErrorKind::InvalidInput, "context and head_limit values must not be negative.");

    std::vector<std::string> argv{rg_path};
    auto args = build_ripgrep_args(opts);
    argv.insert(argv.end(), args.begin(), args.end());

    ForegroundExecutor exec;
    ForegroundResult r = exec.run_process(argv, timeout);
    switch (r.status) {
        case ForegroundStatus::StartFailed:
            return ToolResult::failure(ErrorKind::System, "Failed to execute rg: " + r.error);
        case ForegroundStatus::TimedOut:
            return ToolResult::failure(ErrorKind::Timeout, "rg timed out after " + std::to_string(timeout.count()) + " milliseconds.");
        case ForegroundStatus::NonZeroExit:
            if (r.exit_code == 1) return ToolResult::success("No matches found");
            if (r.exit_code == 2 && (trim(r.output).empty() || r.output.find("No files were searched") != std::string::npos)) {
                return ToolResult::failure(ErrorKind::InvalidInput,
                    "No files were searched. This usually means ripgrep applied a filter that excluded all files.");
            }
            return ToolResult::failure(ErrorKind::System, "rg exited with code " + std::to_string(r.exit_code) + ":\n" + r.output);
        case ForegroundStatus::Ok:
            break;
    }

    std::string out = trim(apply_head_limit(limit_lines(r.output, lim), opts.head_limit));
    if (out.empty()) return ToolResult::success("No matches found");
    if (auto too_big = check_output_size(out, "grep", lim)) return ToolResult::failure(ErrorKind::TooLarge, *too_big);
    return ToolResult::success(out);
}

} // namespace toolbox
