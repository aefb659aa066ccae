#include "SweepCoordinator.hpp"
#include "Errors.hpp"
#include "../common/Messages.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace lan_sentry::server
{
    namespace
    {
        DeviceRecord ToRecord(const SweepResult &result)
        {
            DeviceRecord record;
            record.address = result.address;
            record.link_address = result.link_address;
            record.name = result.name;
            record.device_class = result.device_class;
            record.status = lan_sentry::common::DeviceStatus::Online;
            record.last_seen = result.seen_at;
            record.last_response_ms = result.response_ms;
            return record;
        }
    }

    SweepCoordinator::SweepCoordinator(TopologyResolver &resolver, HostProbe &probe, DeviceStore &store, ChangeNotifier &notifier)
        : m_resolver(resolver), m_probe(probe), m_store(store), m_notifier(notifier), m_in_progress(false)
    {
    }

    SweepTicket SweepCoordinator::Reserve()
    {
        bool expected = false;
        if (!m_in_progress.compare_exchange_strong(expected, true))
        {
            throw SweepInProgressError();
        }
        return SweepTicket(m_in_progress);
    }

    SweepReport SweepCoordinator::Sweep()
    {
        return Sweep(Reserve());
    }

    SweepReport SweepCoordinator::Sweep(SweepTicket ticket)
    {
        if (!ticket.IsHeld())
            throw std::logic_error("Sweep called without a reserved slot");

        SweepReport report;
        report.topology = m_resolver.Resolve();
        report.range = TopologyResolver::DeriveSweepRange(report.topology);

        std::cout << "[Sweep] Scanning network: " << report.range.cidr
                  << " via " << report.topology.interface_name << std::endl;

        auto started = std::chrono::steady_clock::now();
        std::vector<SweepResult> results = ProbeAll(report.range);

        for (const auto &result : results)
        {
            if (!report.range.Contains(result.address))
            {
                std::cerr << "[Sweep] Dropping result for " << result.address << ": outside " << report.range.cidr << "\n";
                continue;
            }

            if (m_store.Merge(result))
                report.created++;
            report.devices.push_back(ToRecord(result));
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        std::cout << "[Sweep] Complete: " << report.devices.size() << " hosts up (" << report.created
                  << " new) in " << elapsed.count() << "ms" << std::endl;

        m_notifier.BroadcastSnapshot(lan_sentry::common::EVENT_SCAN_COMPLETE);
        return report;
    }

    std::vector<SweepResult> SweepCoordinator::ProbeAll(const SweepRange &range)
    {
        std::vector<std::string> targets = range.Addresses();
        std::vector<std::future<std::optional<SweepResult>>> pending;
        pending.reserve(targets.size());

        for (const auto &ip : targets)
        {
            pending.push_back(std::async(std::launch::async, [this, ip]() -> std::optional<SweepResult>
            {
                try
                {
                    return m_probe.Probe(ip);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Sweep] Probe of " << ip << " failed: " << e.what() << "\n";
                    return std::nullopt;
                }
            }));
        }

        std::vector<SweepResult> results;
        for (auto &task : pending)
        {
            std::optional<SweepResult> settled = task.get();
            if (settled)
                results.push_back(std::move(*settled));
        }
        return results;
    }
}
