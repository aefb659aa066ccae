#pragma once

#include <atomic>
#include <cstdint>
#include "LookupPool.hpp"
#include "NetworkProbe.hpp"

namespace lan_sentry::server
{
    // libtins-backed probe: raw ICMP echo and ARP, so it needs root.
    class TinsNetworkProbe : public NetworkProbe
    {
    public:
        TinsNetworkProbe();

        std::vector<InterfaceInfo> ListInterfaces() override;
        std::optional<double> Ping(const std::string &ip, std::chrono::milliseconds timeout) override;
        std::optional<std::string> ResolveLinkAddress(const std::string &ip) override;
        std::optional<std::string> ResolveName(const std::string &ip, std::chrono::milliseconds timeout) override;

    private:
        // Slow reverse lookups occupy at most this many threads.
        static constexpr unsigned NAME_LOOKUP_THREADS = 16;

        std::atomic<uint16_t> m_next_echo_id;
        LookupPool m_names;
    };

    bool IsRoot();
}
