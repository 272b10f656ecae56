#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace mdns_session
{

// FIFO between the engine worker (producer) and the polling consumer.
// Events are never dropped quietly: once the bound is hit, further pushes are
// refused and the overflow flag stays set until Reset().
template <typename T>
class EventQueue
{
public:
    explicit EventQueue(std::size_t maxQueueSize) : m_maxQueueSize(maxQueueSize) {}

    bool Push(T event)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_overflowed || m_events.size() >= m_maxQueueSize) {
            m_overflowed = true;
            return false;
        }
        m_events.push_back(std::move(event));
        return true;
    }

    std::vector<T> Drain()
    {
        std::deque<T> events;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            events.swap(m_events);
        }
        return std::vector<T>(std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()));
    }

    [[nodiscard]] bool Overflowed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_overflowed;
    }

    [[nodiscard]] std::size_t Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.size();
    }

    [[nodiscard]] std::size_t Capacity() const { return m_maxQueueSize; }

    void Reset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
        m_overflowed = false;
    }

private:
    mutable std::mutex m_mutex;
    std::deque<T> m_events;
    const std::size_t m_maxQueueSize;
    bool m_overflowed{false};
};

}
