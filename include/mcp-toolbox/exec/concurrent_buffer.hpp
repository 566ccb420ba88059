/*
 * Concurrent output buffer - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <string>

namespace toolbox {

// Append-only byte sink: one writer (the process pump), many readers (pollers).
// Has its own lock so a writer never waits behind registry bookkeeping.
class ConcurrentBuffer {
public:
    ConcurrentBuffer() = default;
    ConcurrentBuffer(const ConcurrentBuffer&) = delete;
    ConcurrentBuffer& operator=(const ConcurrentBuffer&) = delete;

    void append(const char* data, size_t len);
    void append(const std::string& data) { append(data.data(), data.size()); }

    size_t size() const;
    // Bytes in [from, to); 'to' is clamped to the current size, from >= to gives "".
    std::string read_range(size_t from, size_t to) const;
    std::string str() const;

private:
    mutable std::mutex m_mutex;
    std::string m_data;
};

} // namespace toolbox
