#include "Worker.hpp"
#include "Errors.hpp"

#include <iostream>

namespace lan_sentry::server
{

    Worker::Worker(ApiHandler& handler, unsigned thread_count)
        : running_(false), thread_count_(thread_count == 0 ? 1 : thread_count),
          handler_(handler), sink_(nullptr) {}

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        if (running_)
            return;

        running_ = true;
        for (unsigned i = 0; i < thread_count_; ++i)
        {
            worker_threads_.emplace_back(&Worker::ProcessLoop, this);
        }
    }

    void Worker::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                return;
            running_ = false;
        }
        queue_cv_.notify_all();

        for (auto& t : worker_threads_)
        {
            if (t.joinable())
                t.join();
        }
        worker_threads_.clear();

        // Unserved jobs are dropped; their sweep reservations go with them.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::queue<Job>().swap(job_queue_);
    }

    void Worker::AddJob(uint64_t conn_id, lan_sentry::protocol::MessageType type, std::vector<uint8_t> payload)
    {
        Job job{conn_id, type, std::move(payload), SweepTicket()};

        if (type == lan_sentry::protocol::MessageType::ScanReq)
        {
            try
            {
                job.sweep = handler_.ReserveScan();
            }
            catch (const SweepInProgressError& e)
            {
                std::cout << "[Worker] ScanReq from connection " << conn_id << " refused: " << e.what() << "\n";
                Respond(conn_id, ApiHandler::Error(lan_sentry::protocol::ErrorCode::ScanInProgress, e.what()));
                return;
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push(std::move(job));
        }
        queue_cv_.notify_one();
    }

    void Worker::ProcessLoop()
    {
        while (true)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_)
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            Response response = current_job.sweep.IsHeld()
                ? handler_.HandleReservedScan(std::move(current_job.sweep))
                : handler_.Handle(current_job.type, current_job.payload);

            if (response.type == lan_sentry::protocol::MessageType::ErrorResp)
            {
                std::cout << "[Worker] " << lan_sentry::protocol::ToString(current_job.type)
                          << " from connection " << current_job.conn_id << " answered with an error\n";
            }

            Respond(current_job.conn_id, response);
        }
    }

    void Worker::Respond(uint64_t conn_id, const Response& response)
    {
        if (sink_)
        {
            sink_->QueueResponse(conn_id, response.type, response.payload);
        }
    }
}
