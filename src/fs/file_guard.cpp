/*
 * Read-before-write guard implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/fs/file_guard.hpp>
#include <mutex>
#include <system_error>

namespace toolbox {
namespace fs = std::filesystem;

void FileMutationGuard::record_read(const std::string& path, FileTime mtime) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_read_times[path] = mtime;
}

std::optional<FileTime> FileMutationGuard::recorded(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_read_times.find(path);
    if (it == m_read_times.end()) return std::nullopt;
    return it->second;
}

std::optional<FileTime> FileMutationGuard::disk_mtime(const std::string& path) {
    std::error_code ec;
    FileTime t = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return t;
}

MutationCheck FileMutationGuard::check_mutation(const std::string& path) const {
    return check_mutation(path, disk_mtime(path));
}

MutationCheck FileMutationGuard::check_mutation(const std::string& path, std::optional<FileTime> current) const {
    auto seen = recorded(path);
    if (!seen) {
        // Creating a file nobody has seen is always allowed.
        return current ? MutationCheck::NotRead : MutationCheck::Ok;
    }
    if (current && *current > *seen) return MutationCheck::ModifiedSinceRead;
    return MutationCheck::Ok;
}

} // namespace toolbox
