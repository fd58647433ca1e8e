#include "BlacklistStore.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <utility>

namespace lan_warden::store
{
    namespace
    {
        const char *SQL_SCHEMA =
            "CREATE TABLE IF NOT EXISTS blacklist ("
            "mac TEXT PRIMARY KEY NOT NULL, "
            "timestamp TEXT NOT NULL, "
            "reason TEXT NOT NULL, "
            "ip TEXT"
            ");";

        constexpr int BUSY_TIMEOUT_MS = 2000;

        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        common::Result WriteSnapshot(sqlite3 *db, const BlacklistMap &entries)
        {
            char *err_msg = nullptr;
            if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err_msg) != SQLITE_OK)
            {
                std::string reason = err_msg ? err_msg : sqlite3_errmsg(db);
                sqlite3_free(err_msg);
                return common::Result::Fail("cannot begin transaction: " + reason);
            }

            auto rollback = [db](const std::string &reason)
            {
                std::string full = reason + ": " + sqlite3_errmsg(db);
                sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
                std::cerr << "[DB] Save failed, " << full << std::endl;
                return common::Result::Fail(full);
            };

            if (sqlite3_exec(db, "DELETE FROM blacklist;", nullptr, nullptr, nullptr) != SQLITE_OK)
                return rollback("clear failed");

            const char *sql = "INSERT INTO blacklist (mac, timestamp, reason, ip) VALUES (?, ?, ?, ?);";
            sqlite3_stmt *stmt;
            if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
                return rollback("prepare failed");

            for (const auto &pair : entries)
            {
                const common::BlacklistEntry &entry = pair.second;

                sqlite3_bind_text(stmt, 1, pair.first.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 2, entry.timestamp.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 3, entry.reason.c_str(), -1, SQLITE_TRANSIENT);
                if (entry.ip)
                    sqlite3_bind_text(stmt, 4, entry.ip->c_str(), -1, SQLITE_TRANSIENT);
                else
                    sqlite3_bind_null(stmt, 4);

                if (sqlite3_step(stmt) != SQLITE_DONE)
                {
                    sqlite3_finalize(stmt);
                    return rollback("insert of " + pair.first + " failed");
                }
                sqlite3_reset(stmt);
                sqlite3_clear_bindings(stmt);
            }
            sqlite3_finalize(stmt);

            if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
                return rollback("commit failed");

            return common::Result::Ok();
        }
    }

    BlacklistStore::BlacklistStore(std::string db_path)
        : db_(nullptr), db_path_(std::move(db_path))
    {
    }

    BlacklistStore::~BlacklistStore()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        CloseLocked();
    }

    int BlacklistStore::OpenLocked()
    {
        if (db_)
            return SQLITE_OK;

        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        int rc = sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed (" << db_path_ << "): " << sqlite3_errmsg(db_) << std::endl;
            CloseLocked();
            return rc;
        }

        // Another lan_warden process may be mid-save on the same file
        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

        char *err_msg = nullptr;
        rc = sqlite3_exec(db_, SQL_SCHEMA, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error (" << db_path_ << "): " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            CloseLocked();
            return rc;
        }
        return SQLITE_OK;
    }

    void BlacklistStore::CloseLocked()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    BlacklistMap BlacklistStore::Load()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        BlacklistMap entries;

        if (OpenLocked() != SQLITE_OK)
        {
            std::cerr << "[DB] Blacklist unreadable, starting empty." << std::endl;
            return entries;
        }

        const char *sql = "SELECT mac, timestamp, reason, ip FROM blacklist;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Load failed: " << sqlite3_errmsg(db_) << std::endl;
            return entries;
        }

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            common::BlacklistEntry entry;
            entry.mac = ColumnText(stmt, 0);
            entry.timestamp = ColumnText(stmt, 1);
            entry.reason = ColumnText(stmt, 2);
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
                entry.ip = ColumnText(stmt, 3);

            entries[entry.mac] = entry;
        }

        if (rc != SQLITE_DONE)
        {
            std::cerr << "[DB] Load aborted, treating blacklist as empty: " << sqlite3_errmsg(db_) << std::endl;
            entries.clear();
        }

        sqlite3_finalize(stmt);
        return entries;
    }

    common::Result BlacklistStore::Save(const BlacklistMap &entries)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        int rc = OpenLocked();
        if (rc == SQLITE_NOTADB || rc == SQLITE_CORRUPT)
            return ReplaceCorruptLocked(entries);
        if (rc != SQLITE_OK)
            return common::Result::Fail("cannot open blacklist database " + db_path_);

        return WriteSnapshot(db_, entries);
    }

    common::Result BlacklistStore::ReplaceCorruptLocked(const BlacklistMap &entries)
    {
        std::cerr << "[DB] " << db_path_ << " is corrupt, rebuilding it from the current blacklist" << std::endl;
        CloseLocked();

        const std::string tmp_path = db_path_ + ".tmp";
        std::remove(tmp_path.c_str());

        sqlite3 *tmp_db = nullptr;
        if (sqlite3_open_v2(tmp_path.c_str(), &tmp_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK)
        {
            std::string reason = sqlite3_errmsg(tmp_db);
            sqlite3_close(tmp_db);
            std::remove(tmp_path.c_str());
            return common::Result::Fail("cannot create " + tmp_path + ": " + reason);
        }

        char *err_msg = nullptr;
        common::Result written = common::Result::Ok();
        if (sqlite3_exec(tmp_db, SQL_SCHEMA, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            written = common::Result::Fail(std::string("schema error in ") + tmp_path + ": " + (err_msg ? err_msg : "unknown"));
            sqlite3_free(err_msg);
        }
        else
        {
            written = WriteSnapshot(tmp_db, entries);
        }
        sqlite3_close(tmp_db);

        if (!written)
        {
            std::remove(tmp_path.c_str());
            return written;
        }

        // A journal left by the corrupt file must not be replayed into the new one
        std::remove((db_path_ + "-journal").c_str());
        if (std::rename(tmp_path.c_str(), db_path_.c_str()) != 0)
        {
            std::string reason = std::strerror(errno);
            std::remove(tmp_path.c_str());
            return common::Result::Fail("cannot replace " + db_path_ + ": " + reason);
        }

        std::cout << "[DB] Rebuilt " << db_path_ << " with " << entries.size() << " entries" << std::endl;
        return common::Result::Ok();
    }
}
