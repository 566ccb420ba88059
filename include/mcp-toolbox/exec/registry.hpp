/*
 * Background process registry - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/exec/background.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolbox {

struct RegistryOptions {
    std::string shell = "/bin/bash";
    std::string id_prefix = "shell_";
    std::chrono::milliseconds kill_grace{100};
    bool debug = false;
};

struct StartResult {
    bool ok = false;
    std::string id;
    std::shared_ptr<BackgroundExecution> handle;
    std::string error;
};

enum class PollCode { Ok, NotFound, InvalidFilter };

struct PollResult {
    PollCode code = PollCode::Ok;
    std::string error;
    ExecStatus status = ExecStatus::Running;
    std::optional<int> exit_code; // unset while running
    std::string exec_error;
    std::string new_stdout;
    std::string new_stderr;
    std::chrono::system_clock::time_point timestamp;
};

enum class TerminateStatus { Success, AlreadyCompleted, NotFound, KillFailed };

struct TerminateResult {
    TerminateStatus status = TerminateStatus::NotFound;
    std::string command;
    std::string error;
};

struct ExecutionInfo {
    std::string id;
    std::string description;
    std::string command;
    ExecStatus status = ExecStatus::Running;
};

// Shared table of background executions. One reader/writer lock guards the
// map, the id counter and every entry's read cursors; it is never held across
// process I/O.
class ProcessRegistry {
public:
    explicit ProcessRegistry(RegistryOptions opts = {});
    ~ProcessRegistry(); // SIGKILLs whatever is still running
    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Spawn first, then allocate an id and insert; a failed spawn leaves no entry.
    StartResult start(const std::string& command, const std::string& description = {});

    std::shared_ptr<BackgroundExecution> lookup(const std::string& id) const;

    // New output since the previous poll, optionally filtered line by line.
    PollResult poll_output(const std::string& id, const std::string& filter = {});

    TerminateResult terminate(const std::string& id);

    std::vector<ExecutionInfo> list() const;

    size_t size() const;

private:
    std::shared_ptr<BackgroundExecution> allocate(const std::string& command, const std::string& description, pid_t pid);

    RegistryOptions m_opts;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<BackgroundExecution>> m_shells;
    uint64_t m_next_id = 1;
};

} // namespace toolbox
