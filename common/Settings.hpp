#pragma once

#include <chrono>
#include <string>

namespace lan_warden::common
{
    // Limit used by time-limit checks that are not given one
    inline constexpr int DEFAULT_TIME_LIMIT_MINUTES = 120;

    struct MonitorSettings
    {
        std::chrono::milliseconds scan_interval = std::chrono::seconds(30);
        std::chrono::milliseconds backend_timeout = std::chrono::seconds(10);
        std::chrono::milliseconds disconnect_grace = std::chrono::seconds(5);

        // How long an active-probe sweep listens for replies
        std::chrono::milliseconds probe_listen = std::chrono::seconds(2);

        std::chrono::seconds active_window = std::chrono::seconds(300);

        // 0 disables the loop's time-limit notifications; --time-limit turns them on
        int time_limit_minutes = 0;

        int notify_port = 9999;
        std::string database_path = "blacklist.db";

        std::string block_message = "Your device has been blocked by the network administrator.";
        std::string time_limit_message = "Your WiFi time is up. Please disconnect now.";
    };
}
