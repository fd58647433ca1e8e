#include "AccessManager.hpp"
#include "../common/Address.hpp"
#include "../common/TimeFormat.hpp"
#include <iostream>
#include <utility>

namespace lan_warden::monitor
{
    AccessManager::AccessManager(DeviceDirectory &directory,
                                 store::Blacklist &blacklist,
                                 actions::FirewallAction &firewall,
                                 common::Clock clock)
        : m_directory(directory), m_blacklist(blacklist), m_firewall(firewall), m_clock(std::move(clock))
    {
    }

    common::Result AccessManager::Add(const std::string &mac, const std::string &reason)
    {
        auto canonical = common::NormalizeMac(mac);
        if (!canonical)
            return common::Result::Fail("invalid MAC address '" + mac + "'");

        std::lock_guard<std::mutex> lock(m_mutex);

        common::BlacklistEntry entry;
        entry.mac = *canonical;
        entry.reason = reason;
        entry.timestamp = common::FormatIso8601(m_clock());
        if (auto device = m_directory.Find(*canonical))
            entry.ip = device->ip;

        common::Result saved = m_blacklist.Put(entry);
        if (!saved)
        {
            std::cerr << "[Access] Could not persist blacklist entry for " << *canonical << ": " << saved.error << "\n";
            return saved;
        }

        if (entry.ip)
        {
            common::Result blocked = m_firewall.Block(*entry.ip);
            if (!blocked)
                std::cerr << "[Access] Block of " << *entry.ip << " failed, will retry on next cycle: " << blocked.error << "\n";
        }

        std::cout << "[Access] Device " << *canonical << " added to blacklist" << (entry.ip ? " and blocked" : "") << "\n";
        return common::Result::Ok();
    }

    common::Result AccessManager::Remove(const std::string &mac)
    {
        auto canonical = common::NormalizeMac(mac);
        if (!canonical)
            return common::Result::Fail("invalid MAC address '" + mac + "'");

        std::lock_guard<std::mutex> lock(m_mutex);

        auto entry = m_blacklist.Find(*canonical);
        if (!entry)
            return common::Result::Fail("device " + *canonical + " not found in blacklist");

        common::Result erased = m_blacklist.Erase(*canonical);
        if (!erased)
        {
            std::cerr << "[Access] Could not persist removal of " << *canonical << ": " << erased.error << "\n";
            return erased;
        }

        if (entry->ip)
        {
            common::Result unblocked = m_firewall.Unblock(*entry->ip);
            if (!unblocked)
            {
                std::cerr << "[Access] Unblock of " << *entry->ip << " failed: " << unblocked.error << "\n";
                return common::Result::Fail("removed from blacklist but unblock failed: " + unblocked.error);
            }
        }

        std::cout << "[Access] Device " << *canonical << " removed from blacklist and unblocked\n";
        return common::Result::Ok();
    }
}
