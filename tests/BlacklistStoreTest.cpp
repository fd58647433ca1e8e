#include <gtest/gtest.h>
#include "../store/BlacklistStore.hpp"
#include "../store/Blacklist.hpp"
#include "TestDoubles.hpp"

using namespace lan_warden;

namespace
{
    common::BlacklistEntry Entry(const std::string &mac, const std::string &reason,
                                 std::optional<std::string> ip = std::nullopt)
    {
        return common::BlacklistEntry{mac, reason, "2026-10-19T08:00:00", std::move(ip)};
    }
}

TEST(BlacklistStore, MissingDatabaseLoadsEmpty)
{
    test::TempDir dir;
    store::BlacklistStore store(dir.File("blacklist.db"));
    EXPECT_TRUE(store.Load().empty());
}

TEST(BlacklistStore, CorruptDatabaseLoadsEmpty)
{
    test::TempDir dir;
    dir.Write("blacklist.db", std::string(4096, 'x'));

    {
        store::BlacklistStore store(dir.File("blacklist.db"));
        store::Blacklist blacklist(store);
        EXPECT_EQ(blacklist.Size(), 0u);

        // The next write replaces the unreadable file
        ASSERT_TRUE(blacklist.Put(Entry("AA:BB:CC:DD:EE:01", "curfew")));
        ASSERT_TRUE(blacklist.Put(Entry("AA:BB:CC:DD:EE:02", "guest")));
    }

    store::BlacklistStore reopened(dir.File("blacklist.db"));
    auto loaded = reopened.Load();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded["AA:BB:CC:DD:EE:01"].reason, "curfew");
    EXPECT_EQ(loaded["AA:BB:CC:DD:EE:02"].reason, "guest");
}

TEST(BlacklistStore, SnapshotSurvivesReopen)
{
    test::TempDir dir;
    {
        store::BlacklistStore store(dir.File("blacklist.db"));
        store::BlacklistMap entries;
        entries["AA:BB:CC:DD:EE:01"] = Entry("AA:BB:CC:DD:EE:01", "curfew", std::string("192.168.1.5"));
        entries["AA:BB:CC:DD:EE:02"] = Entry("AA:BB:CC:DD:EE:02", "unknown device");
        ASSERT_TRUE(store.Save(entries));
    }

    store::BlacklistStore reopened(dir.File("blacklist.db"));
    auto loaded = reopened.Load();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded["AA:BB:CC:DD:EE:01"].reason, "curfew");
    EXPECT_EQ(loaded["AA:BB:CC:DD:EE:01"].timestamp, "2026-10-19T08:00:00");
    ASSERT_TRUE(loaded["AA:BB:CC:DD:EE:01"].ip.has_value());
    EXPECT_EQ(*loaded["AA:BB:CC:DD:EE:01"].ip, "192.168.1.5");
    EXPECT_FALSE(loaded["AA:BB:CC:DD:EE:02"].ip.has_value());
}

TEST(BlacklistStore, SaveReplacesWholeSnapshot)
{
    test::TempDir dir;
    store::BlacklistStore store(dir.File("blacklist.db"));

    store::BlacklistMap first;
    first["AA:BB:CC:DD:EE:01"] = Entry("AA:BB:CC:DD:EE:01", "a");
    first["AA:BB:CC:DD:EE:02"] = Entry("AA:BB:CC:DD:EE:02", "b");
    ASSERT_TRUE(store.Save(first));

    store::BlacklistMap second;
    second["AA:BB:CC:DD:EE:03"] = Entry("AA:BB:CC:DD:EE:03", "c");
    ASSERT_TRUE(store.Save(second));

    auto loaded = store.Load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.count("AA:BB:CC:DD:EE:03"), 1u);
}

TEST(BlacklistStore, UnwritableLocationIsReportedOnSave)
{
    store::BlacklistStore store("/nonexistent-lan-warden-dir/blacklist.db");
    EXPECT_TRUE(store.Load().empty());

    common::Result saved = store.Save({{"AA:BB:CC:DD:EE:01", Entry("AA:BB:CC:DD:EE:01", "x")}});
    EXPECT_FALSE(saved.ok);
    EXPECT_FALSE(saved.error.empty());
}

TEST(Blacklist, FailedFlushLeavesMemoryUnchanged)
{
    store::BlacklistStore store("/nonexistent-lan-warden-dir/blacklist.db");
    store::Blacklist blacklist(store);

    EXPECT_FALSE(blacklist.Put(Entry("AA:BB:CC:DD:EE:01", "x")).ok);
    EXPECT_FALSE(blacklist.Contains("AA:BB:CC:DD:EE:01"));
    EXPECT_EQ(blacklist.Size(), 0u);
}

TEST(Blacklist, ReloadPicksUpWritesFromAnotherConnection)
{
    test::TempDir dir;
    store::BlacklistStore monitorStore(dir.File("blacklist.db"));
    store::Blacklist monitorView(monitorStore);

    store::BlacklistStore cliStore(dir.File("blacklist.db"));
    store::Blacklist cliView(cliStore);
    ASSERT_TRUE(cliView.Put(Entry("AA:BB:CC:DD:EE:01", "curfew")));

    EXPECT_FALSE(monitorView.Contains("AA:BB:CC:DD:EE:01"));
    monitorView.Reload();
    EXPECT_TRUE(monitorView.Contains("AA:BB:CC:DD:EE:01"));

    ASSERT_TRUE(cliView.Erase("AA:BB:CC:DD:EE:01"));
    monitorView.Reload();
    EXPECT_EQ(monitorView.Size(), 0u);
}

TEST(Blacklist, LoadsPersistedEntriesAtStartup)
{
    test::TempDir dir;
    {
        store::BlacklistStore store(dir.File("blacklist.db"));
        store::Blacklist blacklist(store);
        ASSERT_TRUE(blacklist.Put(Entry("AA:BB:CC:DD:EE:01", "curfew")));
    }

    store::BlacklistStore store(dir.File("blacklist.db"));
    store::Blacklist blacklist(store);
    EXPECT_TRUE(blacklist.Contains("AA:BB:CC:DD:EE:01"));
    EXPECT_FALSE(blacklist.Erase("AA:BB:CC:DD:EE:99").ok);
}
