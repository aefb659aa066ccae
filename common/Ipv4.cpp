#include "Ipv4.hpp"

#include <arpa/inet.h>

namespace lan_sentry::common
{
    std::optional<uint32_t> ParseIpv4(const std::string &dotted)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, dotted.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(uint32_t address)
    {
        struct in_addr addr;
        addr.s_addr = htonl(address);

        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
            return "";
        return buf;
    }

    bool IsValidIpv4(const std::string &dotted)
    {
        return ParseIpv4(dotted).has_value();
    }

    int LastOctet(const std::string &dotted)
    {
        auto parsed = ParseIpv4(dotted);
        if (!parsed)
            return -1;
        return static_cast<int>(*parsed & 0xFF);
    }
}
