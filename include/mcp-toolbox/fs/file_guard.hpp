/*
 * Read-before-write guard - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace toolbox {

using FileTime = std::filesystem::file_time_type;

enum class MutationCheck { Ok, NotRead, ModifiedSinceRead };

// Optimistic concurrency for file mutations: remembers the mtime seen at the
// last read of each canonical path and refuses to overwrite content that was
// never read, or that changed on disk since.
class FileMutationGuard {
public:
    FileMutationGuard() = default;
    FileMutationGuard(const FileMutationGuard&) = delete;
    FileMutationGuard& operator=(const FileMutationGuard&) = delete;

    // Overwrites any previous entry.
    void record_read(const std::string& path, FileTime mtime);

    std::optional<FileTime> recorded(const std::string& path) const;

    // Stats the file, then compares outside of any I/O.
    MutationCheck check_mutation(const std::string& path) const;
    // `current` is the on-disk mtime, or nullopt if the file does not exist.
    MutationCheck check_mutation(const std::string& path, std::optional<FileTime> current) const;

    // nullopt if the path cannot be stat'ed.
    static std::optional<FileTime> disk_mtime(const std::string& path);

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, FileTime> m_read_times;
};

} // namespace toolbox
