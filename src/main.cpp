/*
 * MCP-Toolbox - entry point
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/config/config.hpp>
#include <mcp-toolbox/server/mcp_server.hpp>
#include <mcp-toolbox/tools/context.hpp>
#include <mcp-toolbox/version.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace toolbox;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    CliOptions cli = parse_args(args);
    switch (cli.action) {
        case CliAction::Help: std::cout << usage_text(argv[0]); return 0;
        case CliAction::Version: std::cout << MCP_TOOLBOX_NAME << ' ' << MCP_TOOLBOX_VERSION << '\n'; return 0;
        case CliAction::Error: std::cerr << "[toolbox] " << cli.error << '\n' << usage_text(argv[0]); return 2;
        case CliAction::Run: break;
    }

    ServerConfig cfg;
    std::string err;
    bool explicit_path = !cli.config_path.empty();
    std::string path = explicit_path ? cli.config_path : default_config_path();
    if (!load_config_file(path, cfg, err, explicit_path)) {
        std::cerr << "[toolbox] " << err << '\n';
        return 1;
    }
    if (cli.debug) cfg.debug = true;

    // A client that hangs up must not kill us mid-write.
    std::signal(SIGPIPE, SIG_IGN);

    std::ios::sync_with_stdio(false);
    ToolContext& ctx = default_context(cfg);
    std::cerr << "[toolbox] " << MCP_TOOLBOX_NAME << ' ' << MCP_TOOLBOX_VERSION << " serving on stdio (shell="
              << ctx.config.shell << (ctx.config.debug ? ", debug" : "") << ")\n";
    {
        McpServer server(ctx, std::cout);
        server.serve(std::cin);
    }
    std::cerr << "[toolbox] stdin closed, shutting down (" << ctx.registry.size() << " background shell(s))\n";
    return 0;
}
