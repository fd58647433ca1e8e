#pragma once

#include <chrono>
#include <string>
#include "Types.hpp"

namespace lan_warden::common
{
    // HH:MM:SS, hours are not wrapped at 24
    std::string FormatDuration(std::chrono::seconds duration);

    // YYYY-MM-DD HH:MM:SS in local time
    std::string FormatTimestamp(TimePoint tp);

    // YYYY-MM-DDTHH:MM:SS in local time
    std::string FormatIso8601(TimePoint tp);
}
