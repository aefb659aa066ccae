#include "HostProbe.hpp"
#include "../common/Ipv4.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>

namespace lan_sentry::server
{
    using lan_sentry::common::DeviceClass;

    namespace
    {
        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool ContainsAny(const std::string &haystack, std::initializer_list<const char *> needles)
        {
            for (const char *needle : needles)
            {
                if (haystack.find(needle) != std::string::npos)
                    return true;
            }
            return false;
        }
    }

    DeviceClass ClassifyDevice(const std::string &ip, const std::optional<std::string> &name)
    {
        int last_octet = lan_sentry::common::LastOctet(ip);

        if (last_octet == 1)
            return DeviceClass::Router;

        if (name && !name->empty())
        {
            std::string lower = ToLower(*name);
            if (ContainsAny(lower, {"router", "gateway"})) return DeviceClass::Router;
            if (ContainsAny(lower, {"switch"})) return DeviceClass::Switch;
            if (ContainsAny(lower, {"printer"})) return DeviceClass::Printer;
            if (ContainsAny(lower, {"phone", "android", "iphone"})) return DeviceClass::Phone;
            if (ContainsAny(lower, {"tv", "roku", "chromecast"})) return DeviceClass::SmartTV;
            if (ContainsAny(lower, {"camera"})) return DeviceClass::Camera;
            if (ContainsAny(lower, {"server"})) return DeviceClass::Server;
        }

        if (last_octet <= 50) return DeviceClass::Server;
        if (last_octet <= 100) return DeviceClass::Computer;
        return DeviceClass::Device;
    }

    HostProbe::HostProbe(NetworkProbe &probe, ProbeSettings settings)
        : m_probe(probe), m_settings(settings)
    {
    }

    std::optional<SweepResult> HostProbe::Probe(const std::string &ip)
    {
        std::optional<double> latency = m_probe.Ping(ip, m_settings.reach_timeout);
        if (!latency)
            return std::nullopt;

        auto seen_at = lan_sentry::common::Clock::now();
        auto link_address = LinkAddressOf(ip);
        auto name = NameOf(ip);

        SweepResult result;
        result.address = ip;
        result.link_address = link_address.value_or(lan_sentry::common::UNKNOWN_LINK_ADDRESS);
        result.name = name.value_or(ip);
        result.device_class = ClassifyDevice(ip, name);
        result.seen_at = seen_at;
        result.response_ms = *latency;
        return result;
    }

    std::optional<std::string> HostProbe::LinkAddressOf(const std::string &ip)
    {
        try
        {
            auto mac = m_probe.ResolveLinkAddress(ip);
            if (mac && !mac->empty())
                return mac;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Probe] Link address lookup failed for " << ip << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }

    std::optional<std::string> HostProbe::NameOf(const std::string &ip)
    {
        try
        {
            auto name = m_probe.ResolveName(ip, m_settings.name_timeout);
            if (name && !name->empty())
                return name;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Probe] Reverse lookup failed for " << ip << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
