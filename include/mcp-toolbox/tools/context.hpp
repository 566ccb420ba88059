/*
 * Shared tool state - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/config/config.hpp>
#include <mcp-toolbox/exec/registry.hpp>
#include <mcp-toolbox/fs/file_guard.hpp>

namespace toolbox {

// Everything a tool handler may touch. Handlers receive it explicitly; the
// server uses the single process-wide instance from default_context().
struct ToolContext {
    explicit ToolContext(ServerConfig cfg);
    ToolContext(const ToolContext&) = delete;
    ToolContext& operator=(const ToolContext&) = delete;

    ServerConfig config;
    ProcessRegistry registry;
    FileMutationGuard guard;
};

RegistryOptions registry_options(const ServerConfig& cfg);

// Built on first call from `cfg`; later calls ignore the argument.
ToolContext& default_context(const ServerConfig& cfg = {});

} // namespace toolbox
