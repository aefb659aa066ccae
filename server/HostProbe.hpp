#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "NetworkProbe.hpp"
#include "../common/Device.hpp"

namespace lan_sentry::server
{
    struct ProbeSettings
    {
        std::chrono::milliseconds reach_timeout{1000};
        std::chrono::milliseconds name_timeout{500};
    };

    struct SweepResult
    {
        std::string address;
        std::string link_address;
        std::string name;
        lan_sentry::common::DeviceClass device_class;
        lan_sentry::common::Clock::time_point seen_at;
        double response_ms;
    };

    // Ordered heuristic, first match wins. Only a resolved name takes part in the name rules.
    lan_sentry::common::DeviceClass ClassifyDevice(const std::string &ip, const std::optional<std::string> &name);

    class HostProbe
    {
    public:
        HostProbe(NetworkProbe &probe, ProbeSettings settings);

        // nullopt when the host did not answer. Throws only if the reachability check itself fails.
        std::optional<SweepResult> Probe(const std::string &ip);

    private:
        std::optional<std::string> LinkAddressOf(const std::string &ip);
        std::optional<std::string> NameOf(const std::string &ip);

        NetworkProbe &m_probe;
        ProbeSettings m_settings;
    };
}
