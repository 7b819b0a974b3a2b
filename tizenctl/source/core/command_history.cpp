#include "core/command_history.hpp"

CommandHistory::CommandHistory(size_t capacity)
    : m_capacity(capacity) {
}

void CommandHistory::record(const tv::CommandResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_capacity == 0) return;

    m_entries.push_front(result);
    while (m_entries.size() > m_capacity) {
        m_entries.pop_back();
    }
}

std::vector<tv::CommandResult> CommandHistory::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<tv::CommandResult>(m_entries.begin(), m_entries.end());
}

void CommandHistory::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

size_t CommandHistory::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}
