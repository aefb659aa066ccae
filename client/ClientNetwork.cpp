#include "ClientNetwork.hpp"
#include <iostream>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <poll.h>
#include <fcntl.h>

namespace lan_sentry::client
{

    static bool wait_fd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        while (true)
        {
            int r = poll(&pfd, 1, timeout_ms);
            if (r < 0 && errno == EINTR)
                continue;
            return r > 0;
        }
    }

    static bool ssl_write_all(SSL *ssl, int fd, const uint8_t *data, size_t len)
    {
        size_t off = 0;
        while (off < len)
        {
            int n = SSL_write(ssl, data + off, static_cast<int>(len - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(fd, POLLIN, 5000))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(fd, POLLOUT, 5000))
                    return false;
                continue;
            }

            return false;
        }
        return true;
    }

    ClientNetwork::ClientNetwork(std::string host, int port)
        : m_host(std::move(host)), m_port(port), m_socket_fd(-1), m_ssl_ctx(nullptr), m_ssl_handle(nullptr)
    {
        InitSSL();
    }

    ClientNetwork::~ClientNetwork()
    {
        Disconnect();
        CleanupSSL();
    }

    void ClientNetwork::InitSSL()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Failed to create SSL Context");
        }

        // The server ships a self-signed certificate.
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
    }

    void ClientNetwork::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    bool ClientNetwork::Connect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);

        struct sockaddr_in serv_addr;
        std::memset(&serv_addr, 0, sizeof(serv_addr));
        serv_addr.sin_family = AF_INET;
        serv_addr.sin_port = htons(static_cast<uint16_t>(m_port));

        if (inet_pton(AF_INET, m_host.c_str(), &serv_addr.sin_addr) <= 0)
        {
            std::cerr << "[Client] Invalid server address '" << m_host << "'" << std::endl;
            return false;
        }

        m_socket_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket_fd < 0)
        {
            std::cerr << "[Client] Socket creation failed: " << std::strerror(errno) << std::endl;
            return false;
        }

        if (connect(m_socket_fd, reinterpret_cast<struct sockaddr *>(&serv_addr), sizeof(serv_addr)) < 0)
        {
            std::cerr << "[Client] Connection to " << m_host << ":" << m_port << " failed: " << std::strerror(errno) << std::endl;
            CloseLocked();
            return false;
        }

        m_ssl_handle = SSL_new(m_ssl_ctx);
        if (!m_ssl_handle)
        {
            ERR_print_errors_fp(stderr);
            CloseLocked();
            return false;
        }
        SSL_set_fd(m_ssl_handle, m_socket_fd);

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            std::cerr << "[Client] TLS handshake failed." << std::endl;
            ERR_print_errors_fp(stderr);
            CloseLocked();
            return false;
        }

        // Reads below poll with a deadline instead of blocking in SSL_read.
        int flags = fcntl(m_socket_fd, F_GETFL, 0);
        if (flags == -1 || fcntl(m_socket_fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            std::cerr << "[Client] Failed to set O_NONBLOCK" << std::endl;
            CloseLocked();
            return false;
        }

        return true;
    }

    void ClientNetwork::Disconnect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        CloseLocked();
    }

    void ClientNetwork::CloseLocked()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_rx_buf.Clear();
    }

    bool ClientNetwork::SendRequest(lan_sentry::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);

        if (!m_ssl_handle)
            return false;

        std::vector<uint8_t> frame;
        try
        {
            frame = lan_sentry::protocol::BuildFrame(type, payload);
        }
        catch (const std::length_error &e)
        {
            std::cerr << "[Client] " << e.what() << std::endl;
            return false;
        }

        return ssl_write_all(m_ssl_handle, m_socket_fd, frame.data(), frame.size());
    }

    bool ClientNetwork::ReadNextPacket(lan_sentry::common::Frame &out, int timeout_ms)
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);

        if (!m_ssl_handle)
            return false;

        uint8_t tmp[4096];

        while (true)
        {
            lan_sentry::common::FrameStatus status = m_rx_buf.TryExtract(out);
            if (status == lan_sentry::common::FrameStatus::Ready)
                return true;
            if (status == lan_sentry::common::FrameStatus::Malformed)
            {
                std::cerr << "[Client] Malformed frame from server.\n";
                CloseLocked();
                return false;
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_rx_buf.Append(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_ZERO_RETURN || (n == 0 && err == SSL_ERROR_SYSCALL))
            {
                std::cerr << "[Client] Server closed connection.\n";
                CloseLocked();
                return false;
            }
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(m_socket_fd, POLLIN, timeout_ms))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(m_socket_fd, POLLOUT, timeout_ms))
                    return false;
                continue;
            }

            std::cerr << "[Client] SSL_read fatal error: " << err << "\n";
            CloseLocked();
            return false;
        }
    }
}
