/*
 * Concurrent output buffer implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/concurrent_buffer.hpp>

namespace toolbox {

void ConcurrentBuffer::append(const char* data, size_t len) {
    if (len == 0) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.append(data, len);
}

size_t ConcurrentBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size();
}

std::string ConcurrentBuffer::read_range(size_t from, size_t to) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (to > m_data.size()) to = m_data.size();
    if (from >= to) return {};
    return m_data.substr(from, to - from);
}

std::string ConcurrentBuffer::str() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data;
}

} // namespace toolbox
