#include "ConsoleView.hpp"
#include <iomanip>
#include <sstream>

namespace lan_sentry::client
{
    using namespace lan_sentry::common;

    void PrintNetworkInfo(std::ostream &os, const NetworkInfo &info)
    {
        os << "Address : " << info.address << "\n"
           << "Netmask : " << info.netmask << "\n"
           << "Range   : " << info.range;
        if (!info.range_supported)
            os << " (not sweepable, only /24 networks are scanned)";
        os << "\n";
    }

    void PrintDeviceTable(std::ostream &os, const std::vector<DeviceRecord> &devices)
    {
        if (devices.empty())
        {
            os << "No devices found.\n";
            return;
        }

        os << std::left << std::setw(16) << "IP"
           << std::setw(19) << "MAC"
           << std::setw(28) << "NAME"
           << std::setw(10) << "TYPE"
           << std::setw(9) << "STATUS"
           << std::setw(10) << "LATENCY"
           << "LAST SEEN"
           << "\n";
        os << std::string(110, '-') << "\n";

        for (const auto &d : devices)
        {
            std::ostringstream latency;
            latency << std::fixed << std::setprecision(1) << d.last_response_ms << "ms";

            os << std::left << std::setw(16) << d.address
               << std::setw(19) << d.link_address
               << std::setw(28) << d.name
               << std::setw(10) << ToString(d.device_class)
               << std::setw(9) << ToString(d.status)
               << std::setw(10) << latency.str()
               << FormatTimestamp(d.last_seen)
               << "\n";
        }
    }

    void PrintScanSummary(std::ostream &os, const ScanSummary &summary)
    {
        os << "Scanned " << summary.range << ": " << summary.devices.size() << " device(s) responded.\n\n";
        PrintDeviceTable(os, summary.devices);
    }

    void PrintDeviceDetail(std::ostream &os, const DeviceDetail &detail)
    {
        const DeviceRecord &d = detail.device;

        os << "IP        : " << d.address << "\n"
           << "MAC       : " << d.link_address << "\n"
           << "Name      : " << d.name << "\n"
           << "Type      : " << ToString(d.device_class) << "\n"
           << "Status    : " << ToString(d.status) << "\n"
           << "Last seen : " << FormatTimestamp(d.last_seen) << "\n"
           << "Latency   : " << std::fixed << std::setprecision(2) << d.last_response_ms << " ms\n"
           << "\n--- METRICS (simulated) ---\n"
           << "CPU       : " << detail.metrics.cpu << "%\n"
           << "Memory    : " << detail.metrics.memory << "%\n"
           << "Bandwidth : " << detail.metrics.bandwidth << " Mbps\n"
           << "Uptime    : " << detail.metrics.uptime << " s\n";
    }

    void PrintPingReport(std::ostream &os, const std::string &address, const PingReport &report)
    {
        os << "Ping " << address << ": " << (report.alive ? "alive" : "unreachable") << "\n"
           << "  " << report.sent << " sent, " << report.received << " received, "
           << report.packet_loss_pct << "% packet loss\n";
        if (report.alive)
            os << "  average " << std::fixed << std::setprecision(2) << report.response_time_ms << " ms\n";
    }

    void PrintEvent(std::ostream &os, const DeviceEvent &event)
    {
        os << "[" << FormatTimestamp(Clock::now()) << "] " << event.kind;

        if (event.change)
        {
            os << ": " << event.change->address << " is now " << ToString(event.change->status)
               << " (last seen " << FormatTimestamp(event.change->last_seen) << ")\n";
            return;
        }

        os << " (" << event.devices.size() << " device(s))\n";
        PrintDeviceTable(os, event.devices);
        os << "\n";
    }

    void PrintError(std::ostream &os, const ErrorInfo &error)
    {
        os << "[Server Error] " << lan_sentry::protocol::ToString(error.code) << ": " << error.message << "\n";
    }
}
