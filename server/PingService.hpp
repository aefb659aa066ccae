#pragma once

#include <chrono>
#include <string>
#include "NetworkProbe.hpp"
#include "../common/Messages.hpp"

namespace lan_sentry::server
{
    class PingService
    {
    public:
        PingService(NetworkProbe &probe, unsigned count = 4,
                    std::chrono::milliseconds timeout = std::chrono::seconds(2));

        // Throws std::invalid_argument for a malformed address; probe errors propagate.
        lan_sentry::common::PingReport Ping(const std::string &ip);

    private:
        NetworkProbe &m_probe;
        unsigned m_count;
        std::chrono::milliseconds m_timeout;
    };
}
