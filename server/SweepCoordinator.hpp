#pragma once

#include <atomic>
#include <vector>
#include "ChangeNotifier.hpp"
#include "DeviceStore.hpp"
#include "HostProbe.hpp"
#include "TopologyResolver.hpp"

namespace lan_sentry::server
{
    struct SweepReport
    {
        NetworkTopology topology;
        SweepRange range;
        std::vector<DeviceRecord> devices;
        size_t created = 0;
    };

    // Exclusive claim on the coordinator's sweep slot. Released when the ticket is
    // destroyed, whether or not a sweep ran with it.
    class SweepTicket
    {
    public:
        SweepTicket() = default;
        explicit SweepTicket(std::atomic<bool> &flag) : m_flag(&flag) {}
        ~SweepTicket() { Release(); }

        SweepTicket(SweepTicket &&other) noexcept : m_flag(other.m_flag) { other.m_flag = nullptr; }
        SweepTicket &operator=(SweepTicket &&other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_flag = other.m_flag;
                other.m_flag = nullptr;
            }
            return *this;
        }

        SweepTicket(const SweepTicket &) = delete;
        SweepTicket &operator=(const SweepTicket &) = delete;

        bool IsHeld() const { return m_flag != nullptr; }

    private:
        void Release()
        {
            if (m_flag)
                *m_flag = false;
            m_flag = nullptr;
        }

        std::atomic<bool> *m_flag = nullptr;
    };

    class SweepCoordinator
    {
    public:
        SweepCoordinator(TopologyResolver &resolver, HostProbe &probe, DeviceStore &store, ChangeNotifier &notifier);

        SweepCoordinator(const SweepCoordinator &) = delete;
        SweepCoordinator &operator=(const SweepCoordinator &) = delete;

        // Throws SweepInProgressError without waiting when another sweep is running,
        // NoNetworkError / UnsupportedRangeError when the topology cannot be swept.
        SweepReport Sweep();

        // Claims the sweep slot without sweeping. Throws SweepInProgressError when
        // another sweep is running or already reserved.
        SweepTicket Reserve();

        // Runs a sweep on a slot taken by Reserve(). The ticket is consumed.
        SweepReport Sweep(SweepTicket ticket);

        bool IsSweeping() const { return m_in_progress; }

    private:
        std::vector<SweepResult> ProbeAll(const SweepRange &range);

        TopologyResolver &m_resolver;
        HostProbe &m_probe;
        DeviceStore &m_store;
        ChangeNotifier &m_notifier;

        std::atomic<bool> m_in_progress;
    };
}
