/*
 * MCP stdio server - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/json/json.hpp>
#include <mcp-toolbox/tools/context.hpp>
#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace toolbox {

namespace rpc {
const int kParseError = -32700;
const int kInvalidRequest = -32600;
const int kMethodNotFound = -32601;
const int kInvalidParams = -32602;
const int kInternalError = -32603;
}

// Newline-delimited JSON-RPC 2.0. Each tools/call runs on its own thread;
// every response is written as one line under the output mutex.
class McpServer {
public:
    McpServer(ToolContext& ctx, std::ostream& out);
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;
    ~McpServer();

    // Reads requests until EOF, then waits for in-flight calls.
    void serve(std::istream& in);

    // One raw input line; tools/call is dispatched asynchronously.
    void handle_line(const std::string& line);

    // Synchronous dispatch of a parsed message; nullopt for notifications.
    std::optional<json::Value> dispatch(const json::Value& msg);

    void wait_idle();
    size_t in_flight() const;

private:
    json::Value call_tool(const json::Value& params, const json::Value& id);
    void write_message(const json::Value& msg);
    void run_async(json::Value msg);

    ToolContext& m_ctx;
    std::ostream& m_out;
    std::mutex m_write_mutex;
    mutable std::mutex m_flight_mutex;
    std::condition_variable m_flight_cv;
    size_t m_in_flight = 0;
};

json::Value make_result(const json::Value& id, json::Value result);
json::Value make_error(const json::Value& id, int code, const std::string& message);

} // namespace toolbox
