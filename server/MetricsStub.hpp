#pragma once

#include <mutex>
#include <random>
#include "../common/Messages.hpp"

namespace lan_sentry::server
{
    // Synthetic placeholder values; no SNMP/WMI collection behind it.
    class MetricsStub
    {
    public:
        MetricsStub();

        lan_sentry::common::DeviceMetrics Sample();

    private:
        std::mutex m_mutex;
        std::mt19937 m_rng;
    };
}
