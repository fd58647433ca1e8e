#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../common/Clock.hpp"
#include "../common/Settings.hpp"
#include "../common/Types.hpp"
#include "../store/Blacklist.hpp"

namespace lan_warden::monitor
{
    // Every device ever observed, keyed by canonical MAC. Records are never
    // evicted; presence is derived from last_seen at listing time.
    class DeviceDirectory
    {
    public:
        explicit DeviceDirectory(const store::Blacklist &blacklist,
                                 common::Clock clock = common::SystemClock(),
                                 std::chrono::seconds activeWindow = std::chrono::seconds(300));

        void Update(const common::Observation &observation);

        std::vector<common::DeviceRecord> List() const;
        std::optional<common::DeviceRecord> Find(const std::string &mac) const;

        bool ExceedsTimeLimit(const std::string &mac, int limitMinutes = common::DEFAULT_TIME_LIMIT_MINUTES) const;

        std::size_t Size() const;

    private:
        struct Entry
        {
            std::string ip;
            std::string hostname;
            common::TimePoint first_seen;
            common::TimePoint last_seen;
        };

        common::DeviceRecord Derive(const std::string &mac, const Entry &entry, common::TimePoint now) const;

        const store::Blacklist &m_blacklist;
        common::Clock m_clock;
        std::chrono::seconds m_activeWindow;

        std::map<std::string, Entry> m_devices;
        mutable std::mutex m_mutex;
    };
}
