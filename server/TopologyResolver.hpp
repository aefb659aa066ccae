#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "NetworkProbe.hpp"

namespace lan_sentry::server
{
    struct NetworkTopology
    {
        std::string interface_name;
        std::string address;
        std::string netmask;
    };

    // Host part enumerated from .1 to .254 under a /24 prefix.
    struct SweepRange
    {
        uint32_t network = 0;
        std::string cidr;

        bool Contains(const std::string &ip) const;
        std::vector<std::string> Addresses() const;
    };

    class TopologyResolver
    {
    public:
        explicit TopologyResolver(NetworkProbe &probe);

        // First up, non-loopback IPv4 interface. Throws NoNetworkError.
        NetworkTopology Resolve();

        // Only 255.255.255.0 is supported; anything else throws UnsupportedRangeError.
        static SweepRange DeriveSweepRange(const NetworkTopology &topology);

    private:
        NetworkProbe &m_probe;
    };
}
