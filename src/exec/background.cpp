/*
 * Background execution handle implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/background.hpp>
#include <utility>

namespace toolbox {

const char* status_name(ExecStatus s) {
    switch (s) {
        case ExecStatus::Running: return "running";
        case ExecStatus::Completed: return "completed";
        case ExecStatus::Failed: return "failed";
    }
    return "unknown";
}

BackgroundExecution::BackgroundExecution(std::string id, uint64_t seq, std::string command, std::string description, pid_t pid)
    : m_id(std::move(id)), m_seq(seq), m_command(std::move(command)), m_description(std::move(description)),
      m_pid(pid), m_start(std::chrono::system_clock::now()) {}

void BackgroundExecution::wait() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this]{ return done(); });
}

bool BackgroundExecution::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this]{ return done(); });
}

void BackgroundExecution::complete(ExitOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (done()) return;
        m_outcome = std::move(outcome);
        m_done.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

ExitOutcome BackgroundExecution::outcome() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome;
}

ExecStatus BackgroundExecution::status() const {
    if (!done()) return ExecStatus::Running;
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome.exit_code == 0 && m_outcome.error.empty() ? ExecStatus::Completed : ExecStatus::Failed;
}

} // namespace toolbox
