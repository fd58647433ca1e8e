#pragma once

#include <chrono>
#include <functional>
#include "Types.hpp"

namespace lan_warden::common
{
    using Clock = std::function<TimePoint()>;

    inline Clock SystemClock()
    {
        return []
        { return std::chrono::system_clock::now(); };
    }
}
