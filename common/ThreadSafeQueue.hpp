#pragma once

#include <queue>
#include <mutex>
#include <optional>

namespace lan_sentry::common
{
    // Multi-producer queue drained by a consumer that is woken some other way
    // (NetworkCore polls it after its eventfd fires).
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        std::mutex m_mutex;
        bool m_shutdown = false;

    public:
        // Returns false once the queue has been shut down.
        bool Push(T value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown)
                return false;
            m_queue.push(std::move(value));
            return true;
        }

        std::optional<T> TryPop()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        // Later pushes are refused; items already queued can still be popped.
        void Shutdown()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_shutdown = true;
        }
    };
}
