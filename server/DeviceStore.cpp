#include "DeviceStore.hpp"
#include "../common/Ipv4.hpp"

#include <stdexcept>

namespace lan_sentry::server
{
    using lan_sentry::common::DeviceStatus;

    bool DeviceStore::Merge(const SweepResult &result)
    {
        auto key = lan_sentry::common::ParseIpv4(result.address);
        if (!key)
            throw std::invalid_argument("DeviceStore::Merge - invalid address '" + result.address + "'");

        std::lock_guard<std::mutex> lock(m_mutex);

        auto [it, created] = m_devices.try_emplace(*key);
        DeviceRecord &record = it->second;

        if (created)
            record.address = result.address;

        record.link_address = result.link_address;
        record.name = result.name;
        record.device_class = result.device_class;
        record.status = DeviceStatus::Online;
        record.last_seen = result.seen_at;
        record.last_response_ms = result.response_ms;

        return created;
    }

    std::optional<DeviceRecord> DeviceStore::Get(const std::string &ip) const
    {
        auto key = lan_sentry::common::ParseIpv4(ip);
        if (!key)
            return std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(*key);
        if (it != m_devices.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<DeviceRecord> DeviceStore::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<DeviceRecord> out;
        out.reserve(m_devices.size());
        for (const auto &entry : m_devices)
            out.push_back(entry.second);
        return out;
    }

    std::vector<std::string> DeviceStore::Addresses() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<std::string> out;
        out.reserve(m_devices.size());
        for (const auto &entry : m_devices)
            out.push_back(entry.second.address);
        return out;
    }

    size_t DeviceStore::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    std::optional<StatusChange> DeviceStore::ApplyLiveness(const std::string &ip,
                                                           std::optional<double> latency,
                                                           lan_sentry::common::Clock::time_point now)
    {
        auto key = lan_sentry::common::ParseIpv4(ip);
        if (!key)
            return std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(*key);
        if (it == m_devices.end())
            return std::nullopt;

        DeviceRecord &record = it->second;
        DeviceStatus previous = record.status;

        if (latency)
        {
            record.status = DeviceStatus::Online;
            record.last_seen = now;
            record.last_response_ms = *latency;
        }
        else
        {
            // last_seen keeps the last confirmed-alive time
            record.status = DeviceStatus::Offline;
        }

        if (record.status == previous)
            return std::nullopt;

        return StatusChange{record.address, record.status, record.last_seen};
    }
}
