#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lan_sentry::common
{
    // Host byte order.
    std::optional<uint32_t> ParseIpv4(const std::string &dotted);
    std::string FormatIpv4(uint32_t address);

    bool IsValidIpv4(const std::string &dotted);

    // Last octet of a dotted address, or -1 when it does not parse.
    int LastOctet(const std::string &dotted);
}
