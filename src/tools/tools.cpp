/*
 * Tool handlers implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/tools/tools.hpp>
#include <mcp-toolbox/exec/foreground.hpp>
#include <mcp-toolbox/fs/file_tools.hpp>
#include <mcp-toolbox/search/glob.hpp>
#include <mcp-toolbox/search/grep.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>
#include <optional>

namespace toolbox {

namespace {

// Argument accessors: a missing optional key is fine, a wrong type is not.
struct Args {
    const json::Value& v;
    std::string error;

    const json::Value* get(const std::string& key) const {
        const json::Value* p = v.find(key);
        return (p && !p->is_null()) ? p : nullptr;
    }
    bool str(const std::string& key, std::string& out) {
        const json::Value* p = get(key);
        if (!p) return true;
        if (!p->is_string()) { error = key + " must be a string."; return false; }
        out = p->as_string();
        return true;
    }
    bool integer(const std::string& key, long& out) {
        const json::Value* p = get(key);
        if (!p) return true;
        double d = p->as_number();
        if (!p->is_number() || std::floor(d) != d) { error = key + " must be an integer."; return false; }
        // Saturate so an absurd value still trips the caller's range checks.
        const double two63 = 9223372036854775808.0;
        if (d >= two63) out = std::numeric_limits<long>::max();
        else if (d < -two63) out = std::numeric_limits<long>::min();
        else out = static_cast<long>(d);
        return true;
    }
    bool flag(const std::string& key, bool& out) {
        const json::Value* p = get(key);
        if (!p) return true;
        if (!p->is_bool()) { error = key + " must be a boolean."; return false; }
        out = p->as_bool();
        return true;
    }
    ToolResult invalid() const { return ToolResult::failure(ErrorKind::InvalidInput, error); }
};

int clamp_int(long v) {
    return static_cast<int>(std::clamp<long>(v, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

bool blank(const std::string& s) { return s.find_first_not_of(" \t\r\n") == std::string::npos; }

} // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    if (secs > tp) secs -= seconds(1);
    long nanos = static_cast<long>(duration_cast<nanoseconds>(tp - secs).count());
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09ldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, nanos);
    return buf;
}

ToolResult bash_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string command, description;
    long timeout_ms = 0;
    bool background = false;
    if (!a.str("command", command) || !a.str("description", description) ||
        !a.integer("timeout", timeout_ms) || !a.flag("run_in_background", background))
        return a.invalid();
    if (blank(command)) return ToolResult::failure(ErrorKind::InvalidInput, "Command cannot be empty.");
    const long max_ms = ctx.config.max_timeout_ms;
    if (timeout_ms > max_ms) {
        return ToolResult::failure(ErrorKind::InvalidInput,
            "Timeout cannot exceed " + std::to_string(max_ms) + " milliseconds (" + std::to_string(max_ms / 60000) + " minutes).");
    }
    if (timeout_ms < 0) return ToolResult::failure(ErrorKind::InvalidInput, "Timeout must not be negative.");
    if (timeout_ms == 0) timeout_ms = ctx.config.default_timeout_ms;

    if (background) {
        StartResult sr = ctx.registry.start(command, description);
        if (!sr.ok) return ToolResult::failure(ErrorKind::System, sr.error);
        return ToolResult::success("Command running in background with ID: " + sr.id);
    }

    ForegroundExecutor exec(ctx.config.shell);
    ForegroundResult r = exec.run(command, std::chrono::milliseconds(timeout_ms));
    switch (r.status) {
        case ForegroundStatus::TimedOut:
            return ToolResult::failure(ErrorKind::Timeout,
                "Command timed out. Consider increasing the timeout parameter or running in background.");
        case ForegroundStatus::StartFailed:
            return ToolResult::failure(ErrorKind::System, "Failed to execute command: " + r.error + "\n\nCommand: " + command);
        case ForegroundStatus::NonZeroExit:
            return ToolResult::failure(ErrorKind::System,
                "Command exited with code " + std::to_string(r.exit_code) + ":\n" + r.output + "\n\nCommand: " + command);
        case ForegroundStatus::Ok:
            break;
    }
    if (auto too_big = check_output_size(r.output, "bash", ctx.config.limits))
        return ToolResult::failure(ErrorKind::TooLarge, *too_big);
    return ToolResult::success(r.output);
}

static bool shell_id_arg(Args& a, std::string& id, const char* key) {
    if (!a.str(key, id)) return false;
    if (id.empty() && std::string(key) == "shell_id") {
        // older clients send bash_id
        if (!a.str("bash_id", id)) return false;
    }
    if (id.empty()) { a.error = std::string(key) + " is required."; return false; }
    return true;
}

ToolResult bash_output_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string id, filter;
    if (!shell_id_arg(a, id, "shell_id") || !a.str("filter", filter)) return a.invalid();

    PollResult p = ctx.registry.poll_output(id, filter);
    if (p.code == PollCode::NotFound) return ToolResult::failure(ErrorKind::NotFound, p.error);
    if (p.code == PollCode::InvalidFilter) return ToolResult::failure(ErrorKind::InvalidInput, p.error);

    json::Value out = json::Value::object();
    out["status"] = status_name(p.status);
    if (p.exit_code) out["exit_code"] = *p.exit_code;
    if (!p.exec_error.empty()) out["error"] = p.exec_error;
    if (!p.new_stdout.empty()) out["stdout"] = p.new_stdout;
    if (!p.new_stderr.empty()) out["stderr"] = p.new_stderr;
    out["timestamp"] = format_timestamp(p.timestamp);
    return ToolResult::success(out.dump());
}

ToolResult list_shells_tool(ToolContext& ctx, const json::Value&) {
    auto shells = ctx.registry.list();
    if (shells.empty()) return ToolResult::success("No background shells are currently running.");
    json::Value arr = json::Value::array();
    for (auto& s : shells) {
        json::Value e = json::Value::object();
        e["id"] = s.id;
        e["description"] = s.description;
        e["status"] = status_name(s.status);
        arr.push_back(std::move(e));
    }
    json::Value out = json::Value::object();
    out["shells"] = std::move(arr);
    out["count"] = static_cast<long>(shells.size());
    return ToolResult::success(out.dump());
}

ToolResult kill_shell_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string id;
    if (!shell_id_arg(a, id, "shell_id")) return a.invalid();
    TerminateResult t = ctx.registry.terminate(id);
    switch (t.status) {
        case TerminateStatus::Success:
            return ToolResult::success("Successfully killed shell: " + id + " (" + t.command + ")");
        case TerminateStatus::AlreadyCompleted:
            return ToolResult::failure(ErrorKind::Conflict, t.error);
        case TerminateStatus::NotFound:
            return ToolResult::failure(ErrorKind::NotFound, t.error);
        case TerminateStatus::KillFailed:
            return ToolResult::failure(ErrorKind::System, t.error);
    }
    return ToolResult::failure(ErrorKind::System, "unexpected terminate status for " + id);
}

ToolResult read_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string path;
    long offset = 0, limit = 0;
    if (!a.str("file_path", path) || !a.integer("offset", offset) || !a.integer("limit", limit)) return a.invalid();
    if (path.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "file_path is required.");
    FileTools files(ctx.guard, ctx.config.limits);
    return files.read(path, offset, limit);
}

ToolResult write_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string path, content;
    if (!a.str("file_path", path) || !a.str("content", content)) return a.invalid();
    if (path.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "file_path is required.");
    if (!a.get("content")) return ToolResult::failure(ErrorKind::InvalidInput, "content is required.");
    FileTools files(ctx.guard, ctx.config.limits);
    return files.write(path, content);
}

ToolResult edit_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string path, old_string, new_string;
    bool replace_all = false;
    if (!a.str("file_path", path) || !a.str("old_string", old_string) ||
        !a.str("new_string", new_string) || !a.flag("replace_all", replace_all))
        return a.invalid();
    if (path.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "file_path is required.");
    if (!a.get("old_string") || !a.get("new_string"))
        return ToolResult::failure(ErrorKind::InvalidInput, "old_string and new_string are required.");
    FileTools files(ctx.guard, ctx.config.limits);
    return files.edit(path, old_string, new_string, replace_all);
}

ToolResult glob_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    std::string pattern, path;
    if (!a.str("pattern", pattern) || !a.str("path", path)) return a.invalid();
    return glob_files(pattern, path, ctx.config.limits);
}

ToolResult grep_tool(ToolContext& ctx, const json::Value& args) {
    Args a{args, {}};
    GrepOptions o;
    long after = 0, before = 0, context = 0, head = 0;
    if (!a.str("pattern", o.pattern) || !a.str("path", o.path) || !a.str("glob", o.glob) ||
        !a.str("type", o.type) || !a.str("output_mode", o.output_mode) ||
        !a.integer("-A", after) || !a.integer("-B", before) || !a.integer("-C", context) ||
        !a.flag("-n", o.line_numbers) || !a.flag("-i", o.ignore_case) || !a.flag("multiline", o.multiline) ||
        !a.integer("head_limit", head))
        return a.invalid();
    if (o.output_mode.empty()) o.output_mode = "files_with_matches";
    o.after = clamp_int(after);
    o.before = clamp_int(before);
    o.context = clamp_int(context);
    o.head_limit = clamp_int(head);
    return grep_search(o, ctx.config.rg_path, ctx.config.limits, std::chrono::milliseconds(ctx.config.default_timeout_ms));
}

namespace {

json::Value prop(const char* type, const char* description) {
    json::Value p = json::Value::object();
    p["type"] = type;
    p["description"] = description;
    return p;
}

json::Value schema(std::vector<std::pair<std::string, json::Value>> props, std::vector<std::string> required) {
    json::Value s = json::Value::object();
    s["type"] = "object";
    json::Value& ps = s["properties"];
    ps = json::Value::object();
    for (auto& p : props) ps[p.first] = std::move(p.second);
    json::Value req = json::Value::array();
    for (auto& r : required) req.push_back(r);
    s["required"] = std::move(req);
    return s;
}

std::vector<ToolDef> build_definitions() {
    std::vector<ToolDef> defs;
    defs.push_back({"bash",
        "Executes a bash command, in the foreground with a timeout or in the background. "
        "Background commands return an ID for bash_output and kill_shell.",
        schema({{"command", prop("string", "The command to execute")},
                {"description", prop("string", "Short description of what the command does")},
                {"timeout", prop("number", "Optional timeout in milliseconds (max 600000)")},
                {"run_in_background", prop("boolean", "Run the command in the background")}},
               {"command"}),
        bash_tool});
    defs.push_back({"bash_output",
        "Retrieves output produced by a background shell since the last call.",
        schema({{"shell_id", prop("string", "The ID of the background shell")},
                {"filter", prop("string", "Optional regular expression; only fully matching lines are returned")}},
               {"shell_id"}),
        bash_output_tool});
    defs.push_back({"list_shells",
        "Lists background shells with their status.",
        schema({}, {}),
        list_shells_tool});
    defs.push_back({"kill_shell",
        "Kills a running background shell by ID.",
        schema({{"shell_id", prop("string", "The ID of the background shell to kill")}}, {"shell_id"}),
        kill_shell_tool});
    defs.push_back({"read",
        "Reads a file and returns its lines numbered like cat -n.",
        schema({{"file_path", prop("string", "Absolute path of the file to read")},
                {"offset", prop("number", "Line number to start reading from")},
                {"limit", prop("number", "Number of lines to read")}},
               {"file_path"}),
        read_tool});
    defs.push_back({"write",
        "Writes a file. Existing files must be read first.",
        schema({{"file_path", prop("string", "Absolute path of the file to write")},
                {"content", prop("string", "Content to write")}},
               {"file_path", "content"}),
        write_tool});
    defs.push_back({"edit",
        "Performs an exact string replacement in a file that was read first.",
        schema({{"file_path", prop("string", "Absolute path of the file to modify")},
                {"old_string", prop("string", "Text to replace")},
                {"new_string", prop("string", "Replacement text")},
                {"replace_all", prop("boolean", "Replace every occurrence (default false)")}},
               {"file_path", "old_string", "new_string"}),
        edit_tool});
    defs.push_back({"glob",
        "Finds files by glob pattern such as **/*.cpp, newest first.",
        schema({{"pattern", prop("string", "Glob pattern to match")},
                {"path", prop("string", "Directory to search; defaults to the working directory")}},
               {"pattern"}),
        glob_tool});
    defs.push_back({"grep",
        "Searches file contents with ripgrep.",
        schema({{"pattern", prop("string", "Regular expression to search for")},
                {"path", prop("string", "File or directory to search")},
                {"glob", prop("string", "Glob filter for files")},
                {"type", prop("string", "File type filter, e.g. cpp")},
                {"output_mode", prop("string", "content, files_with_matches (default) or count")},
                {"-A", prop("number", "Lines after each match (content mode)")},
                {"-B", prop("number", "Lines before each match (content mode)")},
                {"-C", prop("number", "Lines around each match (content mode)")},
                {"-n", prop("boolean", "Show line numbers (content mode)")},
                {"-i", prop("boolean", "Case insensitive search")},
                {"multiline", prop("boolean", "Let patterns span lines")},
                {"head_limit", prop("number", "Keep only the first N lines of output")}},
               {"pattern"}),
        grep_tool});
    return defs;
}

} // namespace

const std::vector<ToolDef>& tool_definitions() {
    static const std::vector<ToolDef> defs = build_definitions();
    return defs;
}

const ToolDef* find_tool(const std::string& name) {
    for (auto& d : tool_definitions()) if (d.name == name) return &d;
    return nullptr;
}

} // namespace toolbox
