/*
 * Server configuration implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/config/config.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace toolbox {

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r')) ++a;
    size_t b = s.size(); while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r')) --b;
    return s.substr(a, b - a);
}

static bool parse_flag(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

static bool parse_long(const std::string& v, long& out) {
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || n < 0) return false;
    out = n;
    return true;
}

template <typename T>
static void set_number(const std::string& v, T& field) {
    long n = 0;
    if (parse_long(v, n)) field = static_cast<T>(n);
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.mcp-toolboxrc";
}

void apply_config_stream(std::istream& in, ServerConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq));
        auto val = trim(line.substr(eq + 1));
        if (key == "shell") { if (!val.empty()) cfg.shell = val; }
        else if (key == "rg_path") { if (!val.empty()) cfg.rg_path = val; }
        else if (key == "default_timeout_ms") set_number(val, cfg.default_timeout_ms);
        else if (key == "max_timeout_ms") set_number(val, cfg.max_timeout_ms);
        else if (key == "kill_grace_ms") set_number(val, cfg.kill_grace_ms);
        else if (key == "max_output_chars") set_number(val, cfg.limits.max_output_chars);
        else if (key == "max_file_bytes") set_number(val, cfg.limits.max_file_bytes);
        else if (key == "max_result_lines") set_number(val, cfg.limits.max_result_lines);
        else if (key == "debug") cfg.debug = parse_flag(val);
    }
    if (cfg.default_timeout_ms > cfg.max_timeout_ms) cfg.default_timeout_ms = cfg.max_timeout_ms;
}

bool load_config_file(const std::string& path, ServerConfig& cfg, std::string& error, bool must_exist) {
    if (path.empty()) return true;
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (!must_exist && errno == ENOENT) return true;
        error = "cannot read config " + path + ": " + std::strerror(errno);
        return false;
    }
    std::ifstream in(path);
    if (!in) { error = "cannot open config " + path; return false; }
    apply_config_stream(in, cfg);
    return true;
}

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions o;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-h" || a == "--help") { o.action = CliAction::Help; return o; }
        if (a == "--version") { o.action = CliAction::Version; return o; }
        if (a == "-d" || a == "--debug") { o.debug = true; continue; }
        if (a == "--config") {
            if (i + 1 >= args.size()) { o.action = CliAction::Error; o.error = "--config requires a file argument"; return o; }
            o.config_path = args[++i];
            continue;
        }
        if (a.rfind("--config=", 0) == 0) { o.config_path = a.substr(9); continue; }
        o.action = CliAction::Error;
        o.error = "unknown argument: " + a;
        return o;
    }
    return o;
}

std::string usage_text(const std::string& prog) {
    return "Usage: " + prog + " [--config <file>] [-d|--debug] [--version] [-h|--help]\n"
           "Serves bash, file and search tools over MCP (JSON-RPC 2.0 on stdin/stdout).\n"
           "Configuration is read from ~/.mcp-toolboxrc unless --config is given.\n";
}

} // namespace toolbox
