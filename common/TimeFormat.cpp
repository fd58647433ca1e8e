#include "TimeFormat.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lan_warden::common
{
    namespace
    {
        std::string FormatLocal(TimePoint tp, const char *pattern)
        {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm local{};
            localtime_r(&t, &local);

            std::stringstream ss;
            ss << std::put_time(&local, pattern);
            return ss.str();
        }
    }

    std::string FormatDuration(std::chrono::seconds duration)
    {
        long long total = duration.count();
        if (total < 0)
            total = 0;

        long long hours = total / 3600;
        long long minutes = (total % 3600) / 60;
        long long seconds = total % 60;

        std::stringstream ss;
        ss << std::setfill('0') << std::setw(2) << hours << ":"
           << std::setw(2) << minutes << ":"
           << std::setw(2) << seconds;
        return ss.str();
    }

    std::string FormatTimestamp(TimePoint tp)
    {
        return FormatLocal(tp, "%Y-%m-%d %H:%M:%S");
    }

    std::string FormatIso8601(TimePoint tp)
    {
        return FormatLocal(tp, "%Y-%m-%dT%H:%M:%S");
    }
}
