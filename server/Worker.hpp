#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <vector>
#include <atomic>
#include "ApiHandler.hpp"
#include "../common/protocol.hpp"

namespace lan_sentry::server {

    // Where finished requests go. NetworkCore implements it; calls may come from any thread.
    class ResponseSink {
    public:
        virtual ~ResponseSink() = default;
        virtual void QueueResponse(uint64_t conn_id, lan_sentry::protocol::MessageType type,
                                   const std::vector<uint8_t>& payload) = 0;
    };

    struct Job {
        uint64_t conn_id;
        lan_sentry::protocol::MessageType type;
        std::vector<uint8_t> payload;
        SweepTicket sweep;
    };

    class Worker {
    private:
        std::vector<std::thread> worker_threads_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;
        unsigned thread_count_;

        ApiHandler& handler_;
        ResponseSink* sink_;

        void ProcessLoop();
        void Respond(uint64_t conn_id, const Response& response);

    public:
        Worker(ApiHandler& handler, unsigned thread_count);
        ~Worker();

        void Start();
        void Stop();

        void SetResponseSink(ResponseSink* sink) { sink_ = sink; }

        // A ScanReq claims the sweep slot here, on the caller's thread, so a scan
        // arriving during another one is refused at once instead of waiting in the queue.
        void AddJob(uint64_t conn_id, lan_sentry::protocol::MessageType type, std::vector<uint8_t> payload);
    };
}
