/*
 * Background process registry implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/registry.hpp>
#include <mcp-toolbox/exec/output_filter.hpp>
#include <mcp-toolbox/exec/spawn.hpp>
#include <re2/re2.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace toolbox {

// Drains both pipes, reaps the child and fires the completion signal. Runs on
// its own detached thread and owns the descriptors.
static void monitor_execution(std::shared_ptr<BackgroundExecution> shell, SpawnedProcess proc, bool debug) {
    ConcurrentBuffer& out = shell->stdout_sink();
    ConcurrentBuffer& err = shell->stderr_sink();
    pump_output(proc.stdout_fd, proc.stderr_fd,
                [&out](const char* d, size_t n){ out.append(d, n); },
                [&err](const char* d, size_t n){ err.append(d, n); });
    close_fd(proc.stdout_fd);
    close_fd(proc.stderr_fd);
    WaitOutcome w = wait_for_exit(proc.pid);
    if (debug) {
        std::cerr << "[DEBUG] " << shell->id() << " exited code=" << w.exit_code;
        if (!w.error.empty()) std::cerr << " (" << w.error << ")";
        std::cerr << '\n';
    }
    shell->complete(ExitOutcome{w.exit_code, w.error});
}

ProcessRegistry::ProcessRegistry(RegistryOptions opts) : m_opts(std::move(opts)) {}

ProcessRegistry::~ProcessRegistry() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto& kv : m_shells) {
        if (!kv.second->done()) kill_group(kv.second->pid(), SIGKILL);
    }
}

std::shared_ptr<BackgroundExecution> ProcessRegistry::allocate(const std::string& command, const std::string& description, pid_t pid) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    uint64_t seq = m_next_id++;
    auto shell = std::make_shared<BackgroundExecution>(m_opts.id_prefix + std::to_string(seq), seq, command, description, pid);
    m_shells.emplace(shell->id(), shell);
    return shell;
}

StartResult ProcessRegistry::start(const std::string& command, const std::string& description) {
    StartResult res;
    SpawnOptions so; so.shell = m_opts.shell;
    SpawnResult sp = spawn_shell(command, so);
    if (!sp.ok) {
        res.error = "Failed to start background command: " + sp.error;
        if (m_opts.debug) std::cerr << "[DEBUG] " << res.error << '\n';
        return res;
    }
    auto shell = allocate(command, description, sp.proc.pid);
    try {
        std::thread(monitor_execution, shell, sp.proc, m_opts.debug).detach();
    } catch (const std::system_error& e) {
        kill_group(sp.proc.pid, SIGKILL);
        close_fd(sp.proc.stdout_fd);
        close_fd(sp.proc.stderr_fd);
        wait_for_exit(sp.proc.pid);
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_shells.erase(shell->id());
        res.error = std::string("Failed to start background command: ") + e.what();
        return res;
    }
    if (m_opts.debug) std::cerr << "[DEBUG] " << shell->id() << " pid=" << sp.proc.pid << " started: " << command << '\n';
    res.ok = true;
    res.id = shell->id();
    res.handle = shell;
    return res;
}

std::shared_ptr<BackgroundExecution> ProcessRegistry::lookup(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_shells.find(id);
    return it == m_shells.end() ? nullptr : it->second;
}

static std::string not_found_message(const std::string& id) {
    return "Background shell with ID '" + id + "' not found.";
}

PollResult ProcessRegistry::poll_output(const std::string& id, const std::string& filter) {
    PollResult res;
    if (!lookup(id)) {
        res.code = PollCode::NotFound; res.error = not_found_message(id);
        return res;
    }
    std::string filter_error;
    auto re = compile_filter(filter, filter_error);
    if (!filter_error.empty()) {
        res.code = PollCode::InvalidFilter; res.error = filter_error;
        return res;
    }
    res.timestamp = std::chrono::system_clock::now();
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_shells.find(id);
        if (it == m_shells.end()) {
            res.code = PollCode::NotFound; res.error = not_found_message(id);
            return res;
        }
        BackgroundExecution& shell = *it->second;
        // Status before output: once done, the pipes are fully drained, so this
        // slice is the tail of the stream.
        if (shell.done()) {
            ExitOutcome oc = shell.outcome();
            res.status = shell.status();
            res.exit_code = oc.exit_code;
            res.exec_error = oc.error;
        }
        size_t out_end = shell.m_stdout.size();
        size_t err_end = shell.m_stderr.size();
        res.new_stdout = shell.m_stdout.read_range(shell.m_stdout_cursor, out_end);
        res.new_stderr = shell.m_stderr.read_range(shell.m_stderr_cursor, err_end);
        shell.m_stdout_cursor = std::max(shell.m_stdout_cursor, out_end);
        shell.m_stderr_cursor = std::max(shell.m_stderr_cursor, err_end);
    }
    if (re) {
        res.new_stdout = filter_lines(res.new_stdout, *re);
        res.new_stderr = filter_lines(res.new_stderr, *re);
    }
    return res;
}

TerminateResult ProcessRegistry::terminate(const std::string& id) {
    TerminateResult res;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_shells.find(id);
        if (it == m_shells.end() || it->second->m_terminating) {
            res.status = TerminateStatus::NotFound; res.error = not_found_message(id);
            return res;
        }
        BackgroundExecution& shell = *it->second;
        res.command = shell.command();
        if (shell.done()) {
            res.status = TerminateStatus::AlreadyCompleted;
            res.error = "Shell " + id + " has already completed. Cannot kill a finished process.";
            return res;
        }
        if (shell.pid() > 0) {
            int err = kill_group(shell.pid(), SIGKILL);
            if (err == ESRCH) {
                // Reaped, but the monitor has not fired yet.
                res.status = TerminateStatus::AlreadyCompleted;
                res.error = "Shell " + id + " has already completed. Cannot kill a finished process.";
                return res;
            }
            if (err != 0) {
                res.status = TerminateStatus::KillFailed;
                res.error = "Failed to kill shell " + id + ": " + std::strerror(err);
                if (m_opts.debug) std::cerr << "[DEBUG] " << res.error << '\n';
                return res;
            }
        }
        shell.m_terminating = true;
    }
    std::this_thread::sleep_for(m_opts.kill_grace);
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_shells.erase(id);
    }
    if (m_opts.debug) std::cerr << "[DEBUG] " << id << " killed and removed" << '\n';
    res.status = TerminateStatus::Success;
    return res;
}

std::vector<ExecutionInfo> ProcessRegistry::list() const {
    std::vector<std::pair<uint64_t, ExecutionInfo>> rows;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        rows.reserve(m_shells.size());
        for (auto& kv : m_shells) {
            const BackgroundExecution& s = *kv.second;
            rows.push_back({s.seq(), ExecutionInfo{s.id(), s.description(), s.command(), s.status()}});
        }
    }
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b){ return a.first < b.first; });
    std::vector<ExecutionInfo> out; out.reserve(rows.size());
    for (auto& r : rows) out.push_back(std::move(r.second));
    return out;
}

size_t ProcessRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_shells.size();
}

} // namespace toolbox
