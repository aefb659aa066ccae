#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "HostProbe.hpp"
#include "../common/Device.hpp"

namespace lan_sentry::server
{
    using lan_sentry::common::DeviceRecord;
    using lan_sentry::common::StatusChange;

    // Owns every DeviceRecord. Callers only ever receive copies.
    class DeviceStore
    {
    private:
        mutable std::mutex m_mutex;
        std::map<uint32_t, DeviceRecord> m_devices;

    public:
        DeviceStore() = default;

        DeviceStore(const DeviceStore &) = delete;
        DeviceStore &operator=(const DeviceStore &) = delete;

        // Create-or-update. Returns true when a new record was created.
        bool Merge(const SweepResult &result);

        std::optional<DeviceRecord> Get(const std::string &ip) const;

        // Ordered by address.
        std::vector<DeviceRecord> Snapshot() const;
        std::vector<std::string> Addresses() const;
        size_t Size() const;

        // latency == nullopt means the probe explicitly failed to reach the host.
        // Returns the transition when the status flipped; unknown addresses are ignored.
        std::optional<StatusChange> ApplyLiveness(const std::string &ip,
                                                  std::optional<double> latency,
                                                  lan_sentry::common::Clock::time_point now);
    };
}
