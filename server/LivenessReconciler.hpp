#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include "ChangeNotifier.hpp"
#include "DeviceStore.hpp"
#include "NetworkProbe.hpp"

namespace lan_sentry::server
{
    struct CycleStats
    {
        size_t checked = 0;
        size_t transitions = 0;
        size_t errors = 0;
    };

    class LivenessReconciler
    {
    public:
        LivenessReconciler(NetworkProbe &probe, DeviceStore &store, ChangeNotifier &notifier,
                           std::chrono::milliseconds interval = std::chrono::seconds(30),
                           std::chrono::milliseconds probe_timeout = std::chrono::seconds(1));
        ~LivenessReconciler();

        void Start();
        void Stop();

        // One pass over the addresses known when the cycle starts.
        CycleStats RunCycle();

    private:
        void MonitorLoop();
        void SleepInterval();

        NetworkProbe &m_probe;
        DeviceStore &m_store;
        ChangeNotifier &m_notifier;

        std::chrono::milliseconds m_interval;
        std::chrono::milliseconds m_probe_timeout;

        std::atomic<bool> m_running;
        std::thread m_thread;
    };
}
