#include "PingService.hpp"
#include "../common/Ipv4.hpp"

#include <stdexcept>

namespace lan_sentry::server
{
    PingService::PingService(NetworkProbe &probe, unsigned count, std::chrono::milliseconds timeout)
        : m_probe(probe), m_count(count == 0 ? 1 : count), m_timeout(timeout)
    {
    }

    lan_sentry::common::PingReport PingService::Ping(const std::string &ip)
    {
        if (!lan_sentry::common::IsValidIpv4(ip))
            throw std::invalid_argument("Invalid IPv4 address '" + ip + "'");

        lan_sentry::common::PingReport report;
        double total_ms = 0.0;

        for (unsigned i = 0; i < m_count; ++i)
        {
            auto latency = m_probe.Ping(ip, m_timeout);
            report.sent++;
            if (latency)
            {
                report.received++;
                total_ms += *latency;
            }
        }

        report.alive = report.received > 0;
        report.response_time_ms = report.alive ? total_ms / report.received : 0.0;
        report.packet_loss_pct = (report.sent - report.received) * 100 / report.sent;
        return report;
    }
}
