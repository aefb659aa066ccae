#pragma once

#include <stdexcept>
#include <string>

namespace lan_sentry::server
{
    class NoNetworkError : public std::runtime_error
    {
    public:
        NoNetworkError() : std::runtime_error("Could not determine local network") {}
    };

    class UnsupportedRangeError : public std::runtime_error
    {
    public:
        explicit UnsupportedRangeError(const std::string &netmask)
            : std::runtime_error("Unsupported subnet mask " + netmask + ": only /24 networks can be swept") {}
    };

    class SweepInProgressError : public std::runtime_error
    {
    public:
        SweepInProgressError() : std::runtime_error("Scan already in progress") {}
    };
}
