#pragma once

#include <map>
#include <mutex>
#include <string>
#include <sqlite3.h>
#include "../common/Result.hpp"
#include "../common/Types.hpp"

namespace lan_warden::store
{
    using BlacklistMap = std::map<std::string, common::BlacklistEntry>;

    // SQLite-backed snapshot of the blacklist. Every Save() replaces the whole
    // table inside one transaction, so a failed write leaves the previous
    // snapshot untouched.
    class BlacklistStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;
        std::string db_path_;

        // SQLite result code of opening the file and applying the schema
        int OpenLocked();
        void CloseLocked();

        // Writes the snapshot to a fresh file and renames it over the unreadable one.
        common::Result ReplaceCorruptLocked(const BlacklistMap &entries);

    public:
        explicit BlacklistStore(std::string db_path);
        ~BlacklistStore();

        BlacklistStore(const BlacklistStore &) = delete;
        BlacklistStore &operator=(const BlacklistStore &) = delete;

        // Missing, unreadable or corrupt data yields an empty map.
        BlacklistMap Load();

        // A corrupt file is replaced rather than written into.
        common::Result Save(const BlacklistMap &entries);

        const std::string &Path() const { return db_path_; }
    };
}
