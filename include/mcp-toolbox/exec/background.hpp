/*
 * Background execution handle - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <mcp-toolbox/exec/concurrent_buffer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace toolbox {

enum class ExecStatus { Running, Completed, Failed };

const char* status_name(ExecStatus s);

struct ExitOutcome {
    int exit_code = 0;
    std::string error; // wait/signal error, distinct from a nonzero exit code
};

class ProcessRegistry;

// One spawned command tracked asynchronously. Output sinks are filled by the
// monitoring task; cursors belong to the registry and change only under its
// exclusive lock.
class BackgroundExecution {
public:
    BackgroundExecution(std::string id, uint64_t seq, std::string command, std::string description, pid_t pid);
    BackgroundExecution(const BackgroundExecution&) = delete;
    BackgroundExecution& operator=(const BackgroundExecution&) = delete;

    const std::string& id() const { return m_id; }
    uint64_t seq() const { return m_seq; }
    const std::string& command() const { return m_command; }
    const std::string& description() const { return m_description; }
    pid_t pid() const { return m_pid; }
    std::chrono::system_clock::time_point start_time() const { return m_start; }

    ConcurrentBuffer& stdout_sink() { return m_stdout; }
    ConcurrentBuffer& stderr_sink() { return m_stderr; }
    const ConcurrentBuffer& stdout_sink() const { return m_stdout; }
    const ConcurrentBuffer& stderr_sink() const { return m_stderr; }

    // Non-blocking: has the completion signal fired?
    bool done() const { return m_done.load(std::memory_order_acquire); }
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Called once by the monitoring task; later calls are ignored.
    void complete(ExitOutcome outcome);

    // Meaningful only once done() is true.
    ExitOutcome outcome() const;
    ExecStatus status() const;

private:
    friend class ProcessRegistry;

    std::string m_id;
    uint64_t m_seq;
    std::string m_command;
    std::string m_description;
    pid_t m_pid;
    std::chrono::system_clock::time_point m_start;
    ConcurrentBuffer m_stdout;
    ConcurrentBuffer m_stderr;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::atomic<bool> m_done{false};
    ExitOutcome m_outcome;

    size_t m_stdout_cursor = 0;
    size_t m_stderr_cursor = 0;
    bool m_terminating = false;
};

} // namespace toolbox
