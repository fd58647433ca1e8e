#pragma once

#include <mutex>
#include <optional>
#include <string>
#include "BlacklistStore.hpp"

namespace lan_warden::store
{
    // In-memory view of the persisted blacklist. Every mutation is flushed to
    // the store before it becomes visible; a failed flush leaves memory as it was.
    class Blacklist
    {
    public:
        explicit Blacklist(BlacklistStore &store);

        bool Contains(const std::string &mac) const;
        std::optional<common::BlacklistEntry> Find(const std::string &mac) const;
        BlacklistMap Entries() const;
        std::size_t Size() const;

        // Replaces the in-memory view with what is persisted now, picking up
        // changes written by other processes sharing the database.
        void Reload();

        common::Result Put(const common::BlacklistEntry &entry);
        common::Result Erase(const std::string &mac);

    private:
        common::Result Commit(BlacklistMap next);

        BlacklistStore &m_store;
        BlacklistMap m_entries;
        mutable std::mutex m_mutex;
    };
}
