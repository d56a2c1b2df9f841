#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace phashcache {

// Fixed-capacity blocking FIFO. push() applies backpressure when full; pop() waits for
// an item and returns std::nullopt only once the sentinel is set and the queue is drained.
template <typename T>
class WorkQueue {
private:
    std::deque<T> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    bool m_sentinel = false;
    size_t m_maxCapacity;
    std::string m_name;

public:
    WorkQueue(size_t maxCapacity, std::string name)
        : m_maxCapacity(maxCapacity), m_name(std::move(name)) {
        if (m_maxCapacity == 0) {
            throw std::invalid_argument("WorkQueue '" + m_name + "' needs a capacity of at least 1");
        }
    }

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_items.size() < m_maxCapacity; });
        m_items.push_back(std::move(item));
        lock.unlock();
        m_notEmpty.notify_one();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return !m_items.empty() || m_sentinel; });
        if (m_items.empty()) { return std::nullopt; }
        T result = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return result;
    }

    // No more pushes will follow; wakes every waiting consumer.
    void setSentinel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sentinel = true;
        }
        m_notEmpty.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_maxCapacity; }

    const std::string& name() const { return m_name; }
};

} // namespace phashcache
