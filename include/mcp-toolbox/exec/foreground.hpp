/*
 * Foreground executor - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace toolbox {

enum class ForegroundStatus { Ok, TimedOut, NonZeroExit, StartFailed };

struct ForegroundResult {
    ForegroundStatus status = ForegroundStatus::Ok;
    int exit_code = 0;
    std::string output; // stdout and stderr interleaved
    std::string error;
};

// Runs one command to completion under a deadline. No state survives the call.
class ForegroundExecutor {
public:
    explicit ForegroundExecutor(std::string shell = "/bin/bash") : m_shell(std::move(shell)) {}
    ForegroundResult run(const std::string& command, std::chrono::milliseconds timeout) const;
    // Same contract for an argv without a shell in between.
    ForegroundResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const;
private:
    std::string m_shell;
};

} // namespace toolbox
