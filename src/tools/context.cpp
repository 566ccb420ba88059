/*
 * Shared tool state implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/tools/context.hpp>
#include <utility>

namespace toolbox {

RegistryOptions registry_options(const ServerConfig& cfg) {
    RegistryOptions o;
    o.shell = cfg.shell;
    o.kill_grace = std::chrono::milliseconds(cfg.kill_grace_ms);
    o.debug = cfg.debug;
    return o;
}

ToolContext::ToolContext(ServerConfig cfg)
    : config(std::move(cfg)), registry(registry_options(config)) {}

ToolContext& default_context(const ServerConfig& cfg) {
    static ToolContext ctx(cfg);
    return ctx;
}

} // namespace toolbox
