#include "MetricsStub.hpp"

namespace lan_sentry::server
{
    MetricsStub::MetricsStub()
    {
        std::random_device rd;
        m_rng.seed(rd());
    }

    lan_sentry::common::DeviceMetrics MetricsStub::Sample()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        lan_sentry::common::DeviceMetrics metrics;
        metrics.cpu = std::uniform_int_distribution<uint32_t>(0, 99)(m_rng);
        metrics.memory = std::uniform_int_distribution<uint32_t>(0, 99)(m_rng);
        metrics.bandwidth = std::uniform_int_distribution<uint32_t>(0, 999)(m_rng);
        metrics.uptime = std::uniform_int_distribution<uint32_t>(0, 86399)(m_rng);
        return metrics;
    }
}
