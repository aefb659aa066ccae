#include "TopologyResolver.hpp"
#include "Errors.hpp"
#include "../common/Ipv4.hpp"

namespace lan_sentry::server
{
    namespace
    {
        constexpr uint32_t SLASH_24_MASK = 0xFFFFFF00u;
        constexpr uint32_t FIRST_HOST = 1;
        constexpr uint32_t LAST_HOST = 254;
    }

    bool SweepRange::Contains(const std::string &ip) const
    {
        auto parsed = lan_sentry::common::ParseIpv4(ip);
        if (!parsed)
            return false;

        uint32_t host = *parsed & ~SLASH_24_MASK;
        return (*parsed & SLASH_24_MASK) == network && host >= FIRST_HOST && host <= LAST_HOST;
    }

    std::vector<std::string> SweepRange::Addresses() const
    {
        std::vector<std::string> out;
        out.reserve(LAST_HOST - FIRST_HOST + 1);
        for (uint32_t host = FIRST_HOST; host <= LAST_HOST; ++host)
        {
            out.push_back(lan_sentry::common::FormatIpv4(network | host));
        }
        return out;
    }

    TopologyResolver::TopologyResolver(NetworkProbe &probe) : m_probe(probe)
    {
    }

    NetworkTopology TopologyResolver::Resolve()
    {
        for (const auto &iface : m_probe.ListInterfaces())
        {
            if (iface.is_loopback || !iface.is_up)
                continue;

            auto address = lan_sentry::common::ParseIpv4(iface.address);
            auto netmask = lan_sentry::common::ParseIpv4(iface.netmask);
            if (!address || !netmask || *address == 0)
                continue;

            return NetworkTopology{iface.name, iface.address, iface.netmask};
        }

        throw NoNetworkError();
    }

    SweepRange TopologyResolver::DeriveSweepRange(const NetworkTopology &topology)
    {
        auto address = lan_sentry::common::ParseIpv4(topology.address);
        auto netmask = lan_sentry::common::ParseIpv4(topology.netmask);

        if (!address)
            throw NoNetworkError();
        if (!netmask || *netmask != SLASH_24_MASK)
            throw UnsupportedRangeError(topology.netmask);

        SweepRange range;
        range.network = *address & SLASH_24_MASK;
        range.cidr = lan_sentry::common::FormatIpv4(range.network) + "/24";
        return range;
    }
}
