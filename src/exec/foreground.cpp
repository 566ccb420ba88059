/*
 * Foreground executor implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/foreground.hpp>
#include <mcp-toolbox/exec/spawn.hpp>
#include <cerrno>
#include <csignal>
#include <sys/wait.h>
#include <thread>

namespace toolbox {

// waitpid(WNOHANG) until the child is reaped or the deadline passes.
static bool reap_before(pid_t pid, std::chrono::steady_clock::time_point deadline, int& st) {
    while (true) {
        pid_t r = waitpid(pid, &st, WNOHANG);
        if (r == pid) return true;
        if (r < 0 && errno != EINTR) return true; // nothing left to wait for
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

ForegroundResult ForegroundExecutor::run(const std::string& command, std::chrono::milliseconds timeout) const {
    return run_process({m_shell, "-c", command}, timeout);
}

ForegroundResult ForegroundExecutor::run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const {
    ForegroundResult res;
    SpawnResult sp = spawn_process(argv, true);
    if (!sp.ok) {
        res.status = ForegroundStatus::StartFailed;
        res.error = sp.error;
        return res;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string& out = res.output;
    bool drained = pump_output(sp.proc.stdout_fd, -1,
                               [&out](const char* d, size_t n){ out.append(d, n); }, nullptr, deadline);
    close_fd(sp.proc.stdout_fd);

    int st = 0;
    if (!drained || !reap_before(sp.proc.pid, deadline, st)) {
        kill_group(sp.proc.pid, SIGKILL);
        wait_for_exit(sp.proc.pid);
        res.status = ForegroundStatus::TimedOut;
        res.exit_code = -1;
        return res;
    }
    if (WIFEXITED(st)) {
        res.exit_code = WEXITSTATUS(st);
        res.status = res.exit_code == 0 ? ForegroundStatus::Ok : ForegroundStatus::NonZeroExit;
    } else if (WIFSIGNALED(st)) {
        // A SIGKILL from outside reads the same as our own deadline kill.
        if (WTERMSIG(st) == SIGKILL) { res.status = ForegroundStatus::TimedOut; res.exit_code = -1; return res; }
        res.exit_code = 128 + WTERMSIG(st);
        res.status = ForegroundStatus::NonZeroExit;
    }
    return res;
}

} // namespace toolbox
