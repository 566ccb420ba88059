/*
 * Tool handlers - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/json/json.hpp>
#include <mcp-toolbox/tools/context.hpp>
#include <mcp-toolbox/tools/result.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace toolbox {

using ToolHandler = std::function<ToolResult(ToolContext&, const json::Value&)>;

struct ToolDef {
    std::string name;
    std::string description;
    json::Value input_schema;
    ToolHandler handler;
};

// Every tool the server exposes, in tools/list order.
const std::vector<ToolDef>& tool_definitions();
const ToolDef* find_tool(const std::string& name);

ToolResult bash_tool(ToolContext& ctx, const json::Value& args);
ToolResult bash_output_tool(ToolContext& ctx, const json::Value& args);
ToolResult list_shells_tool(ToolContext& ctx, const json::Value& args);
ToolResult kill_shell_tool(ToolContext& ctx, const json::Value& args);
ToolResult read_tool(ToolContext& ctx, const json::Value& args);
ToolResult write_tool(ToolContext& ctx, const json::Value& args);
ToolResult edit_tool(ToolContext& ctx, const json::Value& args);
ToolResult glob_tool(ToolContext& ctx, const json::Value& args);
ToolResult grep_tool(ToolContext& ctx, const json::Value& args);

// RFC 3339 in UTC with nanoseconds, e.g. 2025-01-02T03:04:05.000000006Z.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace toolbox
