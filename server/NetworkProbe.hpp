#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lan_sentry::server
{
    struct InterfaceInfo
    {
        std::string name;
        std::string address;
        std::string netmask;
        bool is_loopback = false;
        bool is_up = false;
    };

    // OS-level network capabilities. Every call must be safe to run
    // concurrently with any other call on the same instance.
    class NetworkProbe
    {
    public:
        virtual ~NetworkProbe() = default;

        virtual std::vector<InterfaceInfo> ListInterfaces() = 0;

        // Round trip in milliseconds, nullopt when no echo reply arrived in time.
        virtual std::optional<double> Ping(const std::string &ip, std::chrono::milliseconds timeout) = 0;

        virtual std::optional<std::string> ResolveLinkAddress(const std::string &ip) = 0;

        virtual std::optional<std::string> ResolveName(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };
}
