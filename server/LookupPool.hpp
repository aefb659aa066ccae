#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lan_sentry::server
{
    // Runs blocking lookups (getnameinfo has no timeout of its own) on a fixed set of
    // threads. A caller stops waiting at its timeout; a request still queued when its
    // deadline passes is dropped without running.
    class LookupPool
    {
    public:
        using LookupFn = std::function<std::optional<std::string>(const std::string &)>;

        LookupPool(LookupFn lookup, unsigned threads);
        ~LookupPool();

        LookupPool(const LookupPool &) = delete;
        LookupPool &operator=(const LookupPool &) = delete;

        // Rethrows what the lookup threw; nullopt on timeout.
        std::optional<std::string> Lookup(const std::string &key, std::chrono::milliseconds timeout);

        size_t ThreadCount() const { return m_threads.size(); }

    private:
        struct Request
        {
            std::string key;
            std::chrono::steady_clock::time_point deadline;
            std::shared_ptr<std::promise<std::optional<std::string>>> result;
        };

        void Run();

        LookupFn m_lookup;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<Request> m_queue;
        bool m_stopping = false;

        std::vector<std::thread> m_threads;
    };
}
