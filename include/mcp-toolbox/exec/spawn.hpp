/*
 * Process spawning - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace toolbox {

struct SpawnOptions {
    std::string shell = "/bin/bash";
    bool merge_stderr = false; // stderr goes to the stdout pipe (2>&1)
};

// A started child. pid doubles as the process group id.
struct SpawnedProcess {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1; // -1 when merged
};

struct SpawnResult {
    bool ok = false;
    SpawnedProcess proc;
    std::string error; // set when !ok
};

struct WaitOutcome {
    int exit_code = -1;
    std::string error; // signal or waitpid failure, empty on a normal exit
};

// Start argv[0] (resolved through PATH) in a new process group with stdin on
// /dev/null. An exec failure in the child is reported as a spawn failure.
SpawnResult spawn_process(const std::vector<std::string>& argv, bool merge_stderr);

// spawn_process({shell, "-c", command}).
SpawnResult spawn_shell(const std::string& command, const SpawnOptions& opts);

using ChunkSink = std::function<void(const char*, size_t)>;

// Read out_fd/err_fd (either may be -1) until both reach EOF.
// Returns false if the deadline passed first; descriptors stay open either way.
bool pump_output(int out_fd, int err_fd, const ChunkSink& on_out, const ChunkSink& on_err,
                 std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

// Fixed lowercase name for common signals ("killed", "terminated"), nullptr
// otherwise. Unlike strsignal it is safe from any thread.
const char* signal_name(int sig);

// Blocking waitpid with EINTR retry.
WaitOutcome wait_for_exit(pid_t pid);

// Signal the whole process group. Returns 0 or errno.
int kill_group(pid_t pgid, int sig);

void close_fd(int& fd);

std::optional<std::string> resolve_executable(const std::string& cmd);

} // namespace toolbox
