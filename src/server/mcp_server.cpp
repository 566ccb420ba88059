/*
 * MCP stdio server implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/server/mcp_server.hpp>
#include <mcp-toolbox/tools/tools.hpp>
#include <mcp-toolbox/version.hpp>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

namespace toolbox {

json::Value make_result(const json::Value& id, json::Value result) {
    json::Value r = json::Value::object();
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    r["result"] = std::move(result);
    return r;
}

json::Value make_error(const json::Value& id, int code, const std::string& message) {
    json::Value err = json::Value::object();
    err["code"] = code;
    err["message"] = message;
    json::Value r = json::Value::object();
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    r["error"] = std::move(err);
    return r;
}

McpServer::McpServer(ToolContext& ctx, std::ostream& out) : m_ctx(ctx), m_out(out) {}

McpServer::~McpServer() { wait_idle(); }

void McpServer::write_message(const json::Value& msg) {
    std::string line = msg.dump();
    std::lock_guard<std::mutex> lk(m_write_mutex);
    m_out << line << '\n';
    m_out.flush();
}

void McpServer::serve(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        handle_line(line);
    }
    if (m_ctx.config.debug) std::cerr << "[DEBUG] stdin closed, waiting for " << in_flight() << " call(s)\n";
    wait_idle();
}

void McpServer::handle_line(const std::string& line) {
    std::string err;
    auto msg = json::parse(line, err);
    if (!msg) {
        write_message(make_error(json::Value(), rpc::kParseError, "Parse error: " + err));
        return;
    }
    const json::Value* method = msg->find("method");
    if (method && method->is_string() && method->as_string() == "tools/call" && msg->contains("id")) {
        run_async(std::move(*msg));
        return;
    }
    if (auto reply = dispatch(*msg)) write_message(*reply);
}

void McpServer::run_async(json::Value msg) {
    {
        std::lock_guard<std::mutex> lk(m_flight_mutex);
        ++m_in_flight;
    }
    auto work = [this](json::Value m) {
        if (auto reply = dispatch(m)) write_message(*reply);
        std::lock_guard<std::mutex> lk(m_flight_mutex);
        if (--m_in_flight == 0) m_flight_cv.notify_all();
    };
    try {
        std::thread(work, msg).detach();
    } catch (const std::system_error& e) {
        if (m_ctx.config.debug) std::cerr << "[DEBUG] cannot start worker (" << e.what() << "), running inline\n";
        work(std::move(msg));
    }
}

void McpServer::wait_idle() {
    std::unique_lock<std::mutex> lk(m_flight_mutex);
    m_flight_cv.wait(lk, [this] { return m_in_flight == 0; });
}

size_t McpServer::in_flight() const {
    std::lock_guard<std::mutex> lk(m_flight_mutex);
    return m_in_flight;
}

std::optional<json::Value> McpServer::dispatch(const json::Value& msg) {
    const json::Value* id_p = msg.find("id");
    json::Value id = id_p ? *id_p : json::Value();
    const json::Value* method_p = msg.find("method");
    if (!msg.is_object() || !method_p || !method_p->is_string()) {
        if (!id_p) return std::nullopt; // stray response or junk notification
        return make_error(id, rpc::kInvalidRequest, "Invalid request");
    }
    const std::string& method = method_p->as_string();
    if (!id_p) {
        if (m_ctx.config.debug) std::cerr << "[DEBUG] notification " << method << '\n';
        return std::nullopt;
    }
    json::Value no_params = json::Value::object();
    const json::Value* params = msg.find("params");
    if (!params || params->is_null()) params = &no_params;

    if (method == "initialize") {
        json::Value r = json::Value::object();
        const json::Value* pv = params->find("protocolVersion");
        r["protocolVersion"] = (pv && pv->is_string()) ? pv->as_string() : std::string(MCP_TOOLBOX_PROTOCOL_VERSION);
        json::Value caps = json::Value::object();
        caps["tools"] = json::Value::object();
        r["capabilities"] = std::move(caps);
        json::Value info = json::Value::object();
        info["name"] = MCP_TOOLBOX_NAME;
        info["version"] = MCP_TOOLBOX_VERSION;
        r["serverInfo"] = std::move(info);
        return make_result(id, std::move(r));
    }
    if (method == "ping") return make_result(id, json::Value::object());
    if (method == "tools/list") {
        json::Value tools = json::Value::array();
        for (auto& def : tool_definitions()) {
            json::Value t = json::Value::object();
            t["name"] = def.name;
            t["description"] = def.description;
            t["inputSchema"] = def.input_schema;
            tools.push_back(std::move(t));
        }
        json::Value r = json::Value::object();
        r["tools"] = std::move(tools);
        return make_result(id, std::move(r));
    }
    if (method == "tools/call") return call_tool(*params, id);
    return make_error(id, rpc::kMethodNotFound, "Method not found: " + method);
}

json::Value McpServer::call_tool(const json::Value& params, const json::Value& id) {
    const json::Value* name = params.find("name");
    if (!name || !name->is_string()) return make_error(id, rpc::kInvalidParams, "tools/call requires a tool name");
    const ToolDef* def = find_tool(name->as_string());
    if (!def) return make_error(id, rpc::kInvalidParams, "Unknown tool: " + name->as_string());
    json::Value args = json::Value::object();
    if (const json::Value* a = params.find("arguments"); a && !a->is_null()) {
        if (!a->is_object()) return make_error(id, rpc::kInvalidParams, "arguments must be an object");
        args = *a;
    }

    if (m_ctx.config.debug) std::cerr << "[DEBUG] tools/call " << def->name << ' ' << args.dump() << '\n';
    ToolResult res;
    try {
        res = def->handler(m_ctx, args);
    } catch (const std::exception& e) {
        res = ToolResult::failure(ErrorKind::System, std::string("internal error in ") + def->name + ": " + e.what());
        std::cerr << "[toolbox] " << res.text << '\n';
    }
    if (m_ctx.config.debug && !res.ok)
        std::cerr << "[DEBUG] " << def->name << " failed (" << error_kind_name(res.kind) << "): " << res.text << '\n';

    json::Value item = json::Value::object();
    item["type"] = "text";
    item["text"] = res.text;
    json::Value content = json::Value::array();
    content.push_back(std::move(item));
    json::Value r = json::Value::object();
    r["content"] = std::move(content);
    r["isError"] = !res.ok;
    return make_result(id, std::move(r));
}

} // namespace toolbox
