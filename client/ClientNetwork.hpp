#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/protocol.hpp"
#include "../common/FrameBuffer.hpp"

namespace lan_sentry::client
{
    class ClientNetwork
    {
    private:
        std::string m_host;
        int m_port;
        int m_socket_fd;

        std::mutex m_io_mutex;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        lan_sentry::common::FrameBuffer m_rx_buf;

        void InitSSL();
        void CleanupSSL();
        void CloseLocked();

    public:
        ClientNetwork(std::string host, int port);
        ~ClientNetwork();

        ClientNetwork(const ClientNetwork &) = delete;
        ClientNetwork &operator=(const ClientNetwork &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        bool SendRequest(lan_sentry::protocol::MessageType type, const std::vector<uint8_t> &payload);

        // timeout_ms < 0 waits indefinitely. False on timeout, close or a malformed stream.
        bool ReadNextPacket(lan_sentry::common::Frame &out, int timeout_ms);
    };
}
