#include "LookupPool.hpp"

namespace lan_sentry::server
{
    LookupPool::LookupPool(LookupFn lookup, unsigned threads) : m_lookup(std::move(lookup))
    {
        if (threads == 0)
            threads = 1;

        for (unsigned i = 0; i < threads; ++i)
        {
            m_threads.emplace_back(&LookupPool::Run, this);
        }
    }

    LookupPool::~LookupPool()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_cv.notify_all();

        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
    }

    std::optional<std::string> LookupPool::Lookup(const std::string &key, std::chrono::milliseconds timeout)
    {
        auto result = std::make_shared<std::promise<std::optional<std::string>>>();
        std::future<std::optional<std::string>> pending = result->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping)
                return std::nullopt;
            m_queue.push_back({key, std::chrono::steady_clock::now() + timeout, result});
        }
        m_cv.notify_one();

        if (pending.wait_for(timeout) != std::future_status::ready)
            return std::nullopt;

        return pending.get();
    }

    void LookupPool::Run()
    {
        while (true)
        {
            Request request;

            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] { return !m_queue.empty() || m_stopping; });

                if (m_stopping)
                    break;

                request = std::move(m_queue.front());
                m_queue.pop_front();
            }

            if (std::chrono::steady_clock::now() >= request.deadline)
            {
                request.result->set_value(std::nullopt);
                continue;
            }

            try
            {
                request.result->set_value(m_lookup(request.key));
            }
            catch (...)
            {
                request.result->set_exception(std::current_exception());
            }
        }
    }
}
