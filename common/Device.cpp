#include "Device.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace lan_sentry::common
{
    const char *ToString(DeviceClass device_class)
    {
        switch (device_class)
        {
        case DeviceClass::Router: return "Router";
        case DeviceClass::Switch: return "Switch";
        case DeviceClass::Printer: return "Printer";
        case DeviceClass::Phone: return "Phone";
        case DeviceClass::SmartTV: return "Smart TV";
        case DeviceClass::Camera: return "Camera";
        case DeviceClass::Server: return "Server";
        case DeviceClass::Computer: return "Computer";
        case DeviceClass::Device: return "Device";
        }
        return "Device";
    }

    const char *ToString(DeviceStatus status)
    {
        return status == DeviceStatus::Online ? "online" : "offline";
    }

    std::optional<DeviceClass> DeviceClassFromByte(std::uint8_t value)
    {
        if (value > static_cast<std::uint8_t>(DeviceClass::Device))
            return std::nullopt;
        return static_cast<DeviceClass>(value);
    }

    std::uint64_t ToEpochMillis(Clock::time_point tp)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
    }

    // Values past the clock's range saturate at the latest representable instant.
    Clock::time_point FromEpochMillis(std::uint64_t millis)
    {
        const auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
        const auto clamped = millis > static_cast<std::uint64_t>(limit) ? limit : static_cast<decltype(limit)>(millis);
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(clamped)));
    }

    std::string FormatTimestamp(Clock::time_point tp)
    {
        if (tp == Clock::time_point{})
            return "never";

        std::time_t t = Clock::to_time_t(tp);
        std::tm local{};
        if (!localtime_r(&t, &local))
            return "unknown";

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}
