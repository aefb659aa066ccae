#include "Messages.hpp"
#include "Codec.hpp"

#include <cmath>
#include <limits>

namespace lan_sentry::common
{
    namespace
    {
        uint32_t MillisToMicros(double ms)
        {
            if (!(ms > 0.0))
                return 0;
            double us = std::round(ms * 1000.0);
            if (us >= static_cast<double>(std::numeric_limits<uint32_t>::max()))
                return std::numeric_limits<uint32_t>::max();
            return static_cast<uint32_t>(us);
        }

        double MicrosToMillis(uint32_t us)
        {
            return static_cast<double>(us) / 1000.0;
        }

        bool ReadStatus(const std::vector<uint8_t> &in, size_t &offset, DeviceStatus &status)
        {
            uint8_t raw = 0;
            if (!wire::read_u8(in, offset, raw) || raw > 1)
                return false;
            status = raw == 1 ? DeviceStatus::Online : DeviceStatus::Offline;
            return true;
        }

        bool ReadTimestamp(const std::vector<uint8_t> &in, size_t &offset, Clock::time_point &tp)
        {
            uint64_t millis = 0;
            if (!wire::read_u64_be(in, offset, millis))
                return false;
            tp = FromEpochMillis(millis);
            return true;
        }
    }

    void AppendDevice(std::vector<uint8_t> &out, const DeviceRecord &device)
    {
        wire::append_string(out, device.address);
        wire::append_string(out, device.link_address);
        wire::append_string(out, device.name);
        wire::append_u8(out, static_cast<uint8_t>(device.device_class));
        wire::append_u8(out, static_cast<uint8_t>(device.status));
        wire::append_u64_be(out, ToEpochMillis(device.last_seen));
        wire::append_u32_be(out, MillisToMicros(device.last_response_ms));
    }

    bool ReadDevice(const std::vector<uint8_t> &in, size_t &offset, DeviceRecord &device)
    {
        size_t tmp = offset;
        DeviceRecord parsed;

        if (!wire::read_string(in, tmp, parsed.address) ||
            !wire::read_string(in, tmp, parsed.link_address) ||
            !wire::read_string(in, tmp, parsed.name))
            return false;

        uint8_t class_byte = 0;
        if (!wire::read_u8(in, tmp, class_byte))
            return false;
        auto device_class = DeviceClassFromByte(class_byte);
        if (!device_class)
            return false;
        parsed.device_class = *device_class;

        if (!ReadStatus(in, tmp, parsed.status) || !ReadTimestamp(in, tmp, parsed.last_seen))
            return false;

        uint32_t response_us = 0;
        if (!wire::read_u32_be(in, tmp, response_us))
            return false;
        parsed.last_response_ms = MicrosToMillis(response_us);

        device = std::move(parsed);
        offset = tmp;
        return true;
    }

    void AppendDeviceList(std::vector<uint8_t> &out, const std::vector<DeviceRecord> &devices)
    {
        wire::append_u32_be(out, static_cast<uint32_t>(devices.size()));
        for (const auto &device : devices)
            AppendDevice(out, device);
    }

    bool ReadDeviceList(const std::vector<uint8_t> &in, size_t &offset, std::vector<DeviceRecord> &devices)
    {
        size_t tmp = offset;
        uint32_t count = 0;
        if (!wire::read_u32_be(in, tmp, count))
            return false;

        std::vector<DeviceRecord> parsed;
        for (uint32_t i = 0; i < count; ++i)
        {
            DeviceRecord device;
            if (!ReadDevice(in, tmp, device))
                return false;
            parsed.push_back(std::move(device));
        }

        devices = std::move(parsed);
        offset = tmp;
        return true;
    }

    std::vector<uint8_t> EncodeNetworkInfo(const NetworkInfo &info)
    {
        std::vector<uint8_t> out;
        wire::append_string(out, info.address);
        wire::append_string(out, info.netmask);
        wire::append_string(out, info.range);
        wire::append_u8(out, info.range_supported ? 1 : 0);
        return out;
    }

    bool DecodeNetworkInfo(const std::vector<uint8_t> &in, NetworkInfo &info)
    {
        size_t offset = 0;
        uint8_t supported = 0;
        if (!wire::read_string(in, offset, info.address) ||
            !wire::read_string(in, offset, info.netmask) ||
            !wire::read_string(in, offset, info.range) ||
            !wire::read_u8(in, offset, supported))
            return false;
        info.range_supported = supported != 0;
        return true;
    }

    std::vector<uint8_t> EncodeScanSummary(const ScanSummary &summary)
    {
        std::vector<uint8_t> out;
        wire::append_string(out, summary.range);
        wire::append_u32_be(out, static_cast<uint32_t>(summary.devices.size()));
        AppendDeviceList(out, summary.devices);
        return out;
    }

    bool DecodeScanSummary(const std::vector<uint8_t> &in, ScanSummary &summary)
    {
        size_t offset = 0;
        uint32_t found = 0;
        if (!wire::read_string(in, offset, summary.range) ||
            !wire::read_u32_be(in, offset, found) ||
            !ReadDeviceList(in, offset, summary.devices))
            return false;
        return found == summary.devices.size();
    }

    std::vector<uint8_t> EncodeDeviceDetail(const DeviceDetail &detail)
    {
        std::vector<uint8_t> out;
        AppendDevice(out, detail.device);
        wire::append_u32_be(out, detail.metrics.cpu);
        wire::append_u32_be(out, detail.metrics.memory);
        wire::append_u32_be(out, detail.metrics.bandwidth);
        wire::append_u32_be(out, detail.metrics.uptime);
        return out;
    }

    bool DecodeDeviceDetail(const std::vector<uint8_t> &in, DeviceDetail &detail)
    {
        size_t offset = 0;
        return ReadDevice(in, offset, detail.device) &&
               wire::read_u32_be(in, offset, detail.metrics.cpu) &&
               wire::read_u32_be(in, offset, detail.metrics.memory) &&
               wire::read_u32_be(in, offset, detail.metrics.bandwidth) &&
               wire::read_u32_be(in, offset, detail.metrics.uptime);
    }

    std::vector<uint8_t> EncodePingReport(const PingReport &report)
    {
        std::vector<uint8_t> out;
        wire::append_u8(out, report.alive ? 1 : 0);
        wire::append_u32_be(out, MillisToMicros(report.response_time_ms));
        wire::append_u32_be(out, report.packet_loss_pct);
        wire::append_u32_be(out, report.sent);
        wire::append_u32_be(out, report.received);
        return out;
    }

    bool DecodePingReport(const std::vector<uint8_t> &in, PingReport &report)
    {
        size_t offset = 0;
        uint8_t alive = 0;
        uint32_t response_us = 0;
        if (!wire::read_u8(in, offset, alive) ||
            !wire::read_u32_be(in, offset, response_us) ||
            !wire::read_u32_be(in, offset, report.packet_loss_pct) ||
            !wire::read_u32_be(in, offset, report.sent) ||
            !wire::read_u32_be(in, offset, report.received))
            return false;
        report.alive = alive != 0;
        report.response_time_ms = MicrosToMillis(response_us);
        return true;
    }

    std::vector<uint8_t> EncodeEvent(const std::string &kind, const std::vector<uint8_t> &body)
    {
        std::vector<uint8_t> out;
        wire::append_string(out, kind);
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    std::vector<uint8_t> EncodeDeviceListBody(const std::vector<DeviceRecord> &devices)
    {
        std::vector<uint8_t> out;
        AppendDeviceList(out, devices);
        return out;
    }

    std::vector<uint8_t> EncodeStatusChangeBody(const StatusChange &change)
    {
        std::vector<uint8_t> out;
        wire::append_string(out, change.address);
        wire::append_u8(out, static_cast<uint8_t>(change.status));
        wire::append_u64_be(out, ToEpochMillis(change.last_seen));
        return out;
    }

    bool DecodeDeviceEvent(const std::vector<uint8_t> &in, DeviceEvent &event)
    {
        size_t offset = 0;
        if (!wire::read_string(in, offset, event.kind))
            return false;

        event.devices.clear();
        event.change.reset();

        if (event.kind == EVENT_STATUS_CHANGE)
        {
            StatusChange change;
            if (!wire::read_string(in, offset, change.address) ||
                !ReadStatus(in, offset, change.status) ||
                !ReadTimestamp(in, offset, change.last_seen))
                return false;
            event.change = std::move(change);
            return true;
        }

        return ReadDeviceList(in, offset, event.devices);
    }

    std::vector<uint8_t> EncodeError(lan_sentry::protocol::ErrorCode code, const std::string &message)
    {
        std::vector<uint8_t> out;
        wire::append_u8(out, static_cast<uint8_t>(code));
        wire::append_string(out, message);
        return out;
    }

    bool DecodeError(const std::vector<uint8_t> &in, ErrorInfo &error)
    {
        size_t offset = 0;
        uint8_t code = 0;
        if (!wire::read_u8(in, offset, code) || !wire::read_string(in, offset, error.message))
            return false;
        error.code = static_cast<lan_sentry::protocol::ErrorCode>(code);
        return true;
    }

    std::vector<uint8_t> EncodeAddress(const std::string &address)
    {
        std::vector<uint8_t> out;
        wire::append_string(out, address);
        return out;
    }

    bool DecodeAddress(const std::vector<uint8_t> &in, std::string &address)
    {
        size_t offset = 0;
        return wire::read_string(in, offset, address) && offset == in.size();
    }
}
