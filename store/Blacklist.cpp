#include "Blacklist.hpp"
#include <iostream>
#include <utility>

namespace lan_warden::store
{
    Blacklist::Blacklist(BlacklistStore &store)
        : m_store(store), m_entries(store.Load())
    {
        std::cout << "[DB] Loaded " << m_entries.size() << " blacklist entries from " << store.Path() << "\n";
    }

    bool Blacklist::Contains(const std::string &mac) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.count(mac) > 0;
    }

    std::optional<common::BlacklistEntry> Blacklist::Find(const std::string &mac) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(mac);
        if (it == m_entries.end())
            return std::nullopt;
        return it->second;
    }

    BlacklistMap Blacklist::Entries() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries;
    }

    std::size_t Blacklist::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    void Blacklist::Reload()
    {
        BlacklistMap current = m_store.Load();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (current.size() != m_entries.size())
            std::cout << "[DB] Blacklist now holds " << current.size() << " entries\n";
        m_entries = std::move(current);
    }

    common::Result Blacklist::Put(const common::BlacklistEntry &entry)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        BlacklistMap next = m_entries;
        next[entry.mac] = entry;
        return Commit(std::move(next));
    }

    common::Result Blacklist::Erase(const std::string &mac)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_entries.find(mac) == m_entries.end())
            return common::Result::Fail(mac + " is not blacklisted");

        BlacklistMap next = m_entries;
        next.erase(mac);
        return Commit(std::move(next));
    }

    common::Result Blacklist::Commit(BlacklistMap next)
    {
        common::Result saved = m_store.Save(next);
        if (saved)
            m_entries = std::move(next);
        return saved;
    }
}
