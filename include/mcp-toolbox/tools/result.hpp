/*
 * Tool result type - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <utility>

namespace toolbox {

enum class ErrorKind { None, InvalidInput, NotFound, Conflict, Timeout, TooLarge, System };

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::TooLarge: return "too_large";
        case ErrorKind::System: return "system";
    }
    return "unknown";
}

// Outcome of one tool call: text on success, a classified message otherwise.
struct ToolResult {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    std::string text;

    static ToolResult success(std::string text) { return ToolResult{true, ErrorKind::None, std::move(text)}; }
    static ToolResult failure(ErrorKind kind, std::string message) { return ToolResult{false, kind, std::move(message)}; }
};

} // namespace toolbox
