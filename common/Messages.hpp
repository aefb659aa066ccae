#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Device.hpp"
#include "protocol.hpp"

namespace lan_sentry::common
{
    inline constexpr const char *EVENT_INITIAL = "initial";
    inline constexpr const char *EVENT_SCAN_COMPLETE = "scan-complete";
    inline constexpr const char *EVENT_STATUS_CHANGE = "status-change";

    struct NetworkInfo
    {
        std::string address;
        std::string netmask;
        std::string range;
        bool range_supported = false;
    };

    struct ScanSummary
    {
        std::string range;
        std::vector<DeviceRecord> devices;
    };

    struct DeviceMetrics
    {
        uint32_t cpu = 0;
        uint32_t memory = 0;
        uint32_t bandwidth = 0;
        uint32_t uptime = 0;
    };

    struct DeviceDetail
    {
        DeviceRecord device;
        DeviceMetrics metrics;
    };

    struct PingReport
    {
        bool alive = false;
        double response_time_ms = 0.0;
        uint32_t packet_loss_pct = 100;
        uint32_t sent = 0;
        uint32_t received = 0;
    };

    struct DeviceEvent
    {
        std::string kind;
        std::vector<DeviceRecord> devices;
        std::optional<StatusChange> change;
    };

    struct ErrorInfo
    {
        lan_sentry::protocol::ErrorCode code = lan_sentry::protocol::ErrorCode::Internal;
        std::string message;
    };

    void AppendDevice(std::vector<uint8_t> &out, const DeviceRecord &device);
    bool ReadDevice(const std::vector<uint8_t> &in, size_t &offset, DeviceRecord &device);

    void AppendDeviceList(std::vector<uint8_t> &out, const std::vector<DeviceRecord> &devices);
    bool ReadDeviceList(const std::vector<uint8_t> &in, size_t &offset, std::vector<DeviceRecord> &devices);

    std::vector<uint8_t> EncodeNetworkInfo(const NetworkInfo &info);
    bool DecodeNetworkInfo(const std::vector<uint8_t> &in, NetworkInfo &info);

    std::vector<uint8_t> EncodeScanSummary(const ScanSummary &summary);
    bool DecodeScanSummary(const std::vector<uint8_t> &in, ScanSummary &summary);

    std::vector<uint8_t> EncodeDeviceDetail(const DeviceDetail &detail);
    bool DecodeDeviceDetail(const std::vector<uint8_t> &in, DeviceDetail &detail);

    std::vector<uint8_t> EncodePingReport(const PingReport &report);
    bool DecodePingReport(const std::vector<uint8_t> &in, PingReport &report);

    // DeviceEvent payload: kind followed by a kind-specific body.
    std::vector<uint8_t> EncodeEvent(const std::string &kind, const std::vector<uint8_t> &body);
    std::vector<uint8_t> EncodeDeviceListBody(const std::vector<DeviceRecord> &devices);
    std::vector<uint8_t> EncodeStatusChangeBody(const StatusChange &change);
    bool DecodeDeviceEvent(const std::vector<uint8_t> &in, DeviceEvent &event);

    std::vector<uint8_t> EncodeError(lan_sentry::protocol::ErrorCode code, const std::string &message);
    bool DecodeError(const std::vector<uint8_t> &in, ErrorInfo &error);

    // Requests that carry a single address (DeviceDetailReq, PingReq).
    std::vector<uint8_t> EncodeAddress(const std::string &address);
    bool DecodeAddress(const std::vector<uint8_t> &in, std::string &address);
}
