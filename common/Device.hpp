#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lan_sentry::common
{
    using Clock = std::chrono::system_clock;

    inline constexpr const char *UNKNOWN_LINK_ADDRESS = "Unknown";

    enum class DeviceClass : std::uint8_t
    {
        Router = 0,
        Switch,
        Printer,
        Phone,
        SmartTV,
        Camera,
        Server,
        Computer,
        Device
    };

    enum class DeviceStatus : std::uint8_t
    {
        Offline = 0,
        Online = 1
    };

    struct DeviceRecord
    {
        std::string address;
        std::string link_address;
        std::string name;
        DeviceClass device_class = DeviceClass::Device;
        DeviceStatus status = DeviceStatus::Offline;
        Clock::time_point last_seen{};
        double last_response_ms = 0.0;
    };

    struct StatusChange
    {
        std::string address;
        DeviceStatus status;
        Clock::time_point last_seen;
    };

    const char *ToString(DeviceClass device_class);
    const char *ToString(DeviceStatus status);

    std::optional<DeviceClass> DeviceClassFromByte(std::uint8_t value);

    // Milliseconds since the Unix epoch.
    std::uint64_t ToEpochMillis(Clock::time_point tp);
    Clock::time_point FromEpochMillis(std::uint64_t millis);

    // Local time, "YYYY-MM-DD HH:MM:SS".
    std::string FormatTimestamp(Clock::time_point tp);
}
