#include "LivenessReconciler.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace lan_sentry::server
{
    LivenessReconciler::LivenessReconciler(NetworkProbe &probe, DeviceStore &store, ChangeNotifier &notifier,
                                           std::chrono::milliseconds interval,
                                           std::chrono::milliseconds probe_timeout)
        : m_probe(probe), m_store(store), m_notifier(notifier),
          m_interval(interval), m_probe_timeout(probe_timeout), m_running(false)
    {
    }

    LivenessReconciler::~LivenessReconciler()
    {
        Stop();
    }

    void LivenessReconciler::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&LivenessReconciler::MonitorLoop, this);
    }

    void LivenessReconciler::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    CycleStats LivenessReconciler::RunCycle()
    {
        CycleStats stats;
        std::vector<std::string> addresses = m_store.Addresses();

        for (const auto &ip : addresses)
        {
            std::optional<double> latency;
            try
            {
                latency = m_probe.Ping(ip, m_probe_timeout);
            }
            catch (const std::exception &e)
            {
                // Not a confirmed miss, leave the record as it is.
                std::cerr << "[Reconciler] Probe of " << ip << " failed: " << e.what() << "\n";
                stats.errors++;
                continue;
            }

            stats.checked++;

            auto change = m_store.ApplyLiveness(ip, latency, lan_sentry::common::Clock::now());
            if (change)
            {
                stats.transitions++;
                std::cout << "[Reconciler] " << change->address << " is now "
                          << lan_sentry::common::ToString(change->status) << std::endl;
                m_notifier.BroadcastStatusChange(*change);
            }
        }

        return stats;
    }

    void LivenessReconciler::MonitorLoop()
    {
        while (m_running)
        {
            SleepInterval();
            if (!m_running)
                break;

            try
            {
                CycleStats stats = RunCycle();
                if (stats.errors > 0)
                {
                    std::cerr << "[Reconciler] Cycle finished with " << stats.errors << " probe errors\n";
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Reconciler] Cycle aborted: " << e.what() << "\n";
            }
        }
    }

    void LivenessReconciler::SleepInterval()
    {
        const auto step = std::chrono::milliseconds(100);
        const auto deadline = std::chrono::steady_clock::now() + m_interval;

        while (m_running && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(step);
        }
    }
}
