#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <algorithm>
#include <climits>
#include <iostream>

#include "NetworkCore.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>

namespace lan_sentry::server
{
    namespace
    {
        constexpr size_t MAX_PENDING_TX = 4 * 1024 * 1024;
        constexpr uint32_t READ_EVENTS = EPOLLIN | EPOLLRDHUP;
    }

    class ConnectionSubscriber : public Subscriber
    {
    public:
        ConnectionSubscriber(NetworkCore *core, uint64_t conn_id)
            : m_core(core), m_conn_id(conn_id), m_open(true) {}

        bool IsWritable() const override { return m_open; }

        void Deliver(const FrameRef &frame) override
        {
            if (m_open)
                m_core->QueueFrame(m_conn_id, frame);
        }

        void Close() { m_open = false; }

    private:
        NetworkCore *m_core;
        uint64_t m_conn_id;
        std::atomic<bool> m_open;
    };

    void NetworkCore::LogOpenSSLErrors()
    {
        ERR_print_errors_fp(stderr);
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK");
        }
    }

    void NetworkCore::EpollControlAdd(int fd, uint32_t events)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Server] Warning: Failed to modify epoll interest for FD " << fd << std::endl;
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = m_registry.find(fd);
        if (it == m_registry.end())
            return;

        ClientContext &ctx = it->second;

        if (ctx.subscriber)
        {
            ctx.subscriber->Close();
            m_notifier.Unsubscribe(ctx.subscription);
        }

        EpollControlRemove(fd);

        if (ctx.ssl_handle)
        {
            // Best-effort close_notify; the socket is closed either way.
            if (ctx.is_handshake_complete)
                SSL_shutdown(ctx.ssl_handle);
            SSL_free(ctx.ssl_handle);
        }
        close(fd);

        std::cout << "[Server] Connection " << ctx.conn_id << " closed." << std::endl;

        m_connections.erase(ctx.conn_id);
        m_registry.erase(it);
    }

    bool NetworkCore::ContinueHandshake(ClientContext &ctx)
    {
        int ret = SSL_accept(ctx.ssl_handle);

        if (ret == 1)
        {
            ctx.is_handshake_complete = true;
            std::cout << "[Server] TLS Handshake complete for connection " << ctx.conn_id << std::endl;
            return true;
        }

        int err = SSL_get_error(ctx.ssl_handle, ret);
        if (err == SSL_ERROR_WANT_READ)
        {
            return true;
        }
        if (err == SSL_ERROR_WANT_WRITE)
        {
            if (!ctx.watching_writable)
            {
                EpollControlModify(ctx.socketfd, READ_EVENTS | EPOLLOUT);
                ctx.watching_writable = true;
            }
            return true;
        }

        std::cerr << "[Server] Fatal SSL Handshake Error on connection " << ctx.conn_id << " (" << err << "). Disconnecting." << std::endl;
        LogOpenSSLErrors();
        return false;
    }

    void NetworkCore::HandleNewConnection()
    {
        struct sockaddr_in clientAddress;
        socklen_t clientAddressLength = sizeof(clientAddress);
        int client_fd = accept(m_server_fd, reinterpret_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
        if (client_fd == -1)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                std::cerr << "[Server] Failed to accept client connection: " << std::strerror(errno) << std::endl;
            return;
        }

        SSL *ssl_handle = SSL_new(m_ssl_ctx);
        if (!ssl_handle)
        {
            std::cerr << "[Server] Failed to allocate new SSL session." << std::endl;
            LogOpenSSLErrors();
            close(client_fd);
            return;
        }
        SSL_set_fd(ssl_handle, client_fd);

        ClientContext &ctx = m_registry[client_fd];
        ctx.socketfd = client_fd;
        ctx.conn_id = m_next_conn_id++;
        ctx.ssl_handle = ssl_handle;
        m_connections[ctx.conn_id] = client_fd;

        try
        {
            NonBlockingMode(client_fd);
            EpollControlAdd(client_fd, READ_EVENTS);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Server] " << e.what() << ". Dropping connection " << ctx.conn_id << std::endl;
            DisconnectClient(client_fd);
            return;
        }

        char peer[INET_ADDRSTRLEN] = "?";
        inet_ntop(AF_INET, &clientAddress.sin_addr, peer, sizeof(peer));
        std::cout << "[Server] New connection " << ctx.conn_id << " from " << peer << std::endl;

        if (!ContinueHandshake(ctx))
        {
            DisconnectClient(client_fd);
        }
    }

    void NetworkCore::HandleClientData(int fd)
    {
        auto it = m_registry.find(fd);
        if (it == m_registry.end())
            return;

        ClientContext &ctx = it->second;

        if (ctx.is_handshake_complete == false)
        {
            if (!ContinueHandshake(ctx))
            {
                DisconnectClient(fd);
                return;
            }
            if (!ctx.is_handshake_complete)
                return;
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.rx.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, count);

            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                break;

            if (err != SSL_ERROR_ZERO_RETURN)
            {
                std::cerr << "[Server] SSL_read error " << err << " on connection " << ctx.conn_id << std::endl;
            }
            DisconnectClient(fd);
            return;
        }

        lan_sentry::common::Frame frame;
        while (true)
        {
            lan_sentry::common::FrameStatus status = ctx.rx.TryExtract(frame);
            if (status == lan_sentry::common::FrameStatus::Incomplete)
                break;

            if (status == lan_sentry::common::FrameStatus::Malformed)
            {
                std::cerr << "[Server] Malformed frame from connection " << ctx.conn_id << ". Disconnecting." << std::endl;
                DisconnectClient(fd);
                return;
            }

            ProcessMessage(ctx, frame);
        }
    }

    void NetworkCore::HandleWritable(int fd)
    {
        auto it = m_registry.find(fd);
        if (it == m_registry.end())
            return;

        ClientContext &ctx = it->second;

        if (!ctx.is_handshake_complete)
        {
            if (!ContinueHandshake(ctx))
            {
                DisconnectClient(fd);
                return;
            }
            if (!ctx.is_handshake_complete)
                return;
        }

        if (!FlushClient(ctx))
        {
            DisconnectClient(fd);
        }
    }

    bool NetworkCore::FlushClient(ClientContext &ctx)
    {
        // Frames wait in tx until the handshake is done.
        if (!ctx.is_handshake_complete)
            return true;

        while (!ctx.tx.Empty())
        {
            int chunk = static_cast<int>(std::min<size_t>(ctx.tx.Size(), INT_MAX));
            int n = SSL_write(ctx.ssl_handle, ctx.tx.Data(), chunk);

            if (n > 0)
            {
                ctx.tx.Consume(static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, n);
            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
            {
                if (!ctx.watching_writable)
                {
                    EpollControlModify(ctx.socketfd, READ_EVENTS | EPOLLOUT);
                    ctx.watching_writable = true;
                }
                return true;
            }

            std::cerr << "[Server] SSL_write failed on connection " << ctx.conn_id << " (" << err << ")" << std::endl;
            LogOpenSSLErrors();
            return false;
        }

        if (ctx.watching_writable)
        {
            EpollControlModify(ctx.socketfd, READ_EVENTS);
            ctx.watching_writable = false;
        }
        return true;
    }

    void NetworkCore::FlushOutbound()
    {
        std::vector<int> touched;

        while (auto item = m_outbound.TryPop())
        {
            auto conn = m_connections.find(item->conn_id);
            if (conn == m_connections.end())
                continue;

            ClientContext &ctx = m_registry[conn->second];
            ctx.tx.Append(item->frame->data(), item->frame->size());
            touched.push_back(conn->second);
        }

        std::sort(touched.begin(), touched.end());
        touched.erase(std::unique(touched.begin(), touched.end()), touched.end());

        for (int fd : touched)
        {
            auto it = m_registry.find(fd);
            if (it == m_registry.end())
                continue;

            if (it->second.tx.Size() > MAX_PENDING_TX)
            {
                std::cerr << "[Server] Connection " << it->second.conn_id
                          << " is not draining its events. Disconnecting." << std::endl;
                DisconnectClient(fd);
                continue;
            }

            if (!FlushClient(it->second))
            {
                DisconnectClient(fd);
            }
        }
    }

    void NetworkCore::Wake()
    {
        uint64_t one = 1;
        // EAGAIN means the counter is saturated, so a wake-up is already pending.
        if (write(m_wake_fd, &one, sizeof(one)) == -1 && errno != EAGAIN)
        {
            m_running = false;
        }
    }

    void NetworkCore::ProcessMessage(ClientContext &ctx, lan_sentry::common::Frame &frame)
    {
        using namespace lan_sentry::protocol;

        std::cout << "[Client " << ctx.conn_id << "] Received " << ToString(frame.type)
                  << " | Size: " << frame.payload.size() << " bytes." << std::endl;

        switch (frame.type)
        {
        case MessageType::SubscribeReq:
            Subscribe(ctx);
            break;

        case MessageType::NetworkInfoReq:
        case MessageType::ScanReq:
        case MessageType::DeviceListReq:
        case MessageType::DeviceDetailReq:
        case MessageType::PingReq:
            m_worker.AddJob(ctx.conn_id, frame.type, std::move(frame.payload));
            break;

        default:
            std::cout << " -> Unknown or Unhandled Message Type." << std::endl;
            QueueResponse(ctx.conn_id, MessageType::ErrorResp,
                          lan_sentry::common::EncodeError(ErrorCode::BadRequest, "Unsupported request type"));
            break;
        }
    }

    void NetworkCore::Subscribe(ClientContext &ctx)
    {
        QueueResponse(ctx.conn_id, lan_sentry::protocol::MessageType::SubscribeResp, {});

        if (ctx.subscriber)
            return;

        ctx.subscriber = std::make_shared<ConnectionSubscriber>(this, ctx.conn_id);
        ctx.subscription = m_notifier.Subscribe(ctx.subscriber);
    }

    void NetworkCore::QueueResponse(uint64_t conn_id, lan_sentry::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        using namespace lan_sentry::protocol;

        std::vector<uint8_t> frame;
        try
        {
            frame = BuildFrame(type, payload);
        }
        catch (const std::length_error &e)
        {
            std::cerr << "[Server] " << e.what() << std::endl;
            frame = BuildFrame(MessageType::ErrorResp,
                               lan_sentry::common::EncodeError(ErrorCode::Internal, "Response too large"));
        }

        QueueFrame(conn_id, std::make_shared<const std::vector<uint8_t>>(std::move(frame)));
    }

    void NetworkCore::QueueFrame(uint64_t conn_id, FrameRef frame)
    {
        if (!m_outbound.Push({conn_id, std::move(frame)}))
            return;
        Wake();
    }

    NetworkCore::NetworkCore(const ServerConfig &config, Worker &worker, ChangeNotifier &notifier)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(config.port), m_running(false),
          m_next_conn_id(1), m_ssl_ctx(nullptr), m_cert_path(config.cert_path), m_key_path(config.key_path),
          m_worker(worker), m_notifier(notifier)
    {
    }

    NetworkCore::~NetworkCore()
    {
        m_outbound.Shutdown();

        for (auto &it : m_registry)
        {
            ClientContext &ctx = it.second;
            if (ctx.subscriber)
            {
                ctx.subscriber->Close();
                m_notifier.Unsubscribe(ctx.subscription);
            }
            if (ctx.ssl_handle)
                SSL_free(ctx.ssl_handle);
            close(it.first);
        }
        m_registry.clear();
        m_connections.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            throw std::runtime_error("Failed to create SSL Context. Is OpenSSL installed?");
        }

        SSL_CTX_set_mode(m_ssl_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_cert_path + "'. Check your paths!");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_key_path + "'.");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private Key does not match the Certificate!");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd, EPOLLIN);
        EpollControlAdd(m_wake_fd, EPOLLIN);

        m_running = true;
    }

    void NetworkCore::Run()
    {
        std::cout << "[Server] Listening on port " << m_port << "..." << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;

                std::cerr << "[Server] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                uint32_t events = ev[i].events;

                if (current_fd == m_server_fd)
                {
                    HandleNewConnection();
                }
                else if (current_fd == m_wake_fd)
                {
                    uint64_t pending = 0;
                    while (read(m_wake_fd, &pending, sizeof(pending)) > 0)
                    {
                    }
                    FlushOutbound();
                }
                else if (events & (EPOLLERR | EPOLLHUP))
                {
                    DisconnectClient(current_fd);
                }
                else
                {
                    if (events & (EPOLLIN | EPOLLRDHUP))
                        HandleClientData(current_fd);
                    if (events & EPOLLOUT)
                        HandleWritable(current_fd);
                }
            }
        }

        std::cout << "[Server] Network loop stopped." << std::endl;
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        if (m_wake_fd != -1)
            Wake();
    }
}
