#ifndef TIZENCTL_COMMAND_HISTORY_HPP
#define TIZENCTL_COMMAND_HISTORY_HPP

#include <deque>
#include <mutex>
#include <vector>

#include "models/tv_types.hpp"

// Most-recent-first record of sent commands, capped at a fixed size
class CommandHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10;

    explicit CommandHistory(size_t capacity = DEFAULT_CAPACITY);

    void record(const tv::CommandResult& result);
    std::vector<tv::CommandResult> entries() const;
    void clear();

    size_t size() const;
    size_t capacity() const { return m_capacity; }

private:
    size_t m_capacity;
    std::deque<tv::CommandResult> m_entries;
    mutable std::mutex m_mutex;
};

#endif
