/*
 * Version - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once

#define MCP_TOOLBOX_NAME "mcp-toolbox"
#define MCP_TOOLBOX_VERSION "0.1.0"
#define MCP_TOOLBOX_PROTOCOL_VERSION "2024-11-05"
