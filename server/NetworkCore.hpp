#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "ChangeNotifier.hpp"
#include "ServerConfig.hpp"
#include "Worker.hpp"
#include "../common/FrameBuffer.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include "../common/protocol.hpp"

namespace lan_sentry::server
{
    class ConnectionSubscriber;

    struct ClientContext
    {
        int socketfd = -1;
        uint64_t conn_id = 0;
        SSL* ssl_handle = nullptr;
        lan_sentry::common::FrameBuffer rx;
        lan_sentry::common::TxBuffer tx;
        bool is_handshake_complete = false;
        bool watching_writable = false;

        std::shared_ptr<ConnectionSubscriber> subscriber;
        SubscriberId subscription = 0;
    };

    struct OutboundFrame
    {
        uint64_t conn_id;
        FrameRef frame;
    };

    class NetworkCore : public ResponseSink
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::atomic<bool> m_running;

        std::map<int, ClientContext> m_registry;
        std::unordered_map<uint64_t, int> m_connections;
        uint64_t m_next_conn_id;

        SSL_CTX* m_ssl_ctx;
        std::string m_cert_path;
        std::string m_key_path;

        Worker& m_worker;
        ChangeNotifier& m_notifier;

        lan_sentry::common::ThreadSafeQueue<OutboundFrame> m_outbound;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd, uint32_t events);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void HandleWritable(int fd);
        bool ContinueHandshake(ClientContext &ctx);

        void FlushOutbound();
        bool FlushClient(ClientContext &ctx);
        void Wake();

        void ProcessMessage(ClientContext &ctx, lan_sentry::common::Frame &frame);
        void Subscribe(ClientContext &ctx);

    public:
        NetworkCore(const ServerConfig &config, Worker &worker, ChangeNotifier &notifier);

        ~NetworkCore() override;

        NetworkCore(const NetworkCore &) = delete;
        NetworkCore &operator=(const NetworkCore &) = delete;

        void Init();
        void Run();

        // Safe from any thread, including a signal handler.
        void Stop();

        // Thread-safe; the actual write happens on the network thread.
        void QueueResponse(uint64_t conn_id, lan_sentry::protocol::MessageType type, const std::vector<uint8_t> &payload) override;
        void QueueFrame(uint64_t conn_id, FrameRef frame);
    };
}
