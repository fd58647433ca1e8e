#include "DeviceDirectory.hpp"
#include "../common/Address.hpp"
#include <iostream>
#include <utility>

namespace lan_warden::monitor
{
    DeviceDirectory::DeviceDirectory(const store::Blacklist &blacklist,
                                     common::Clock clock,
                                     std::chrono::seconds activeWindow)
        : m_blacklist(blacklist), m_clock(std::move(clock)), m_activeWindow(activeWindow)
    {
    }

    void DeviceDirectory::Update(const common::Observation &observation)
    {
        auto mac = common::NormalizeMac(observation.mac);
        if (!mac)
        {
            std::cerr << "[Directory] Ignoring observation with malformed MAC '" << observation.mac << "'\n";
            return;
        }

        common::TimePoint now = m_clock();

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(*mac);
        if (it == m_devices.end())
        {
            Entry entry;
            entry.first_seen = now;
            entry.last_seen = now;
            it = m_devices.emplace(*mac, entry).first;
        }
        else if (now > it->second.last_seen)
        {
            it->second.last_seen = now;
        }

        it->second.ip = observation.ip;
        it->second.hostname = observation.hostname.empty() ? common::UNKNOWN_HOSTNAME : observation.hostname;
    }

    common::DeviceRecord DeviceDirectory::Derive(const std::string &mac, const Entry &entry, common::TimePoint now) const
    {
        common::DeviceRecord record;
        record.mac = mac;
        record.ip = entry.ip;
        record.hostname = entry.hostname;
        record.first_seen = entry.first_seen;
        record.last_seen = entry.last_seen;
        record.connection_duration = std::chrono::duration_cast<std::chrono::seconds>(entry.last_seen - entry.first_seen);
        record.is_blacklisted = m_blacklist.Contains(mac);
        record.status = (now - entry.last_seen) < m_activeWindow ? common::DeviceStatus::Active
                                                                 : common::DeviceStatus::Offline;
        return record;
    }

    std::vector<common::DeviceRecord> DeviceDirectory::List() const
    {
        std::map<std::string, Entry> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_devices;
        }

        common::TimePoint now = m_clock();
        std::vector<common::DeviceRecord> records;
        records.reserve(snapshot.size());
        for (const auto &pair : snapshot)
            records.push_back(Derive(pair.first, pair.second, now));
        return records;
    }

    std::optional<common::DeviceRecord> DeviceDirectory::Find(const std::string &mac) const
    {
        auto canonical = common::NormalizeMac(mac);
        if (!canonical)
            return std::nullopt;

        Entry entry;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_devices.find(*canonical);
            if (it == m_devices.end())
                return std::nullopt;
            entry = it->second;
        }
        return Derive(*canonical, entry, m_clock());
    }

    bool DeviceDirectory::ExceedsTimeLimit(const std::string &mac, int limitMinutes) const
    {
        auto record = Find(mac);
        if (!record)
            return false;
        return record->connection_duration > std::chrono::seconds(static_cast<long long>(limitMinutes) * 60);
    }

    std::size_t DeviceDirectory::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }
}
