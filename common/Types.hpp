#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lan_warden::common
{
    using TimePoint = std::chrono::system_clock::time_point;

    inline constexpr const char *UNKNOWN_HOSTNAME = "Unknown";

    // One raw sighting produced by a scan backend.
    struct Observation
    {
        std::string ip;
        std::string mac;
        std::string hostname;
    };

    enum class DeviceStatus
    {
        Active,
        Offline
    };

    inline const char *ToString(DeviceStatus status)
    {
        return status == DeviceStatus::Active ? "ACTIVE" : "OFFLINE";
    }

    struct DeviceRecord
    {
        std::string mac;
        std::string ip;
        std::string hostname;
        TimePoint first_seen;
        TimePoint last_seen;

        // Derived at listing time
        std::chrono::seconds connection_duration{0};
        bool is_blacklisted = false;
        DeviceStatus status = DeviceStatus::Offline;
    };

    struct BlacklistEntry
    {
        std::string mac;
        std::string reason;
        std::string timestamp; // ISO-8601, creation time
        std::optional<std::string> ip; // address at blocking time, may be stale
    };
}
