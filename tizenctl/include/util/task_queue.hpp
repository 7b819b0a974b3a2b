#ifndef TIZENCTL_TASK_QUEUE_HPP
#define TIZENCTL_TASK_QUEUE_HPP

#include <borealis.hpp>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>

namespace util {

// Feeds tasks to brls::async with at most maxConcurrent of them in flight.
// Tasks never wait on each other, so a serial borealis task loop still drains it.
class TaskQueue : public std::enable_shared_from_this<TaskQueue> {
private:
    struct Private {};

public:
    TaskQueue(Private, int maxConcurrent) : m_maxConcurrent(std::max(1, maxConcurrent)) {}

    static std::shared_ptr<TaskQueue> create(int maxConcurrent) {
        return std::make_shared<TaskQueue>(Private{}, maxConcurrent);
    }

    void enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push(std::move(task));
        }
        processQueue();
    }

private:
    void onTaskComplete() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_activeCount > 0) {
                m_activeCount--;
            }
        }
        processQueue();
    }

    void processQueue() {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_activeCount >= m_maxConcurrent || m_queue.empty()) {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop();
            m_activeCount++;
        }

        auto self = shared_from_this();
        brls::async([self, task]() {
            task();
            self->onTaskComplete();
        });
    }

    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    int m_activeCount = 0;
    int m_maxConcurrent;
};

// Counts outstanding work down to zero; wait() returns once it gets there
class CompletionLatch {
public:
    explicit CompletionLatch(size_t count) : m_count(count) {}

    void countDown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_count > 0 && --m_count == 0) {
            m_cv.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_count == 0; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_count;
};

}

#endif
