#include <gtest/gtest.h>

#include "infrastructure/client_table.hpp"

using namespace extender;
using infrastructure::ClientTable;
using namespace std::chrono_literals;

namespace
{
    const ClientTable::Clock::time_point kStart = ClientTable::Clock::time_point(std::chrono::hours(1));
}

TEST(ClientTableTest, AssociationCreatesRecordWithUnknownAddress)
{
    ClientTable table(30s);

    auto update = table.on_associated("aa:bb:cc:00:11:22", kStart);

    EXPECT_EQ(update.change, ClientTable::Change::JOINED);
    EXPECT_EQ(update.record.mac, "AA:BB:CC:00:11:22");
    EXPECT_FALSE(update.record.ip.has_value());
    EXPECT_FALSE(update.record.lease_overdue);
    EXPECT_EQ(table.size(), 1u);
}

TEST(ClientTableTest, ReassociationIsNotANewClient)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);

    auto update = table.on_associated("AA:BB:CC:00:11:22", kStart + 1s);

    EXPECT_EQ(update.change, ClientTable::Change::NONE);
    EXPECT_EQ(table.size(), 1u);
}

TEST(ClientTableTest, LeaseMergesIntoExistingRecord)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);

    auto update = table.on_lease("AA:BB:CC:00:11:22", "192.168.4.10", "phone", kStart + 2s, 12h);

    EXPECT_EQ(update.change, ClientTable::Change::UPDATED);
    ASSERT_TRUE(update.record.ip.has_value());
    EXPECT_EQ(*update.record.ip, "192.168.4.10");
    EXPECT_EQ(update.record.hostname, "phone");
    EXPECT_EQ(table.size(), 1u);
}

TEST(ClientTableTest, LeaseBeforeAssociationCreatesRecord)
{
    ClientTable table(30s);

    auto lease = table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "*", kStart, 12h);
    auto assoc = table.on_associated("aa:bb:cc:00:11:22", kStart + 1s);

    EXPECT_EQ(lease.change, ClientTable::Change::JOINED);
    EXPECT_TRUE(lease.record.hostname.empty());
    EXPECT_EQ(assoc.change, ClientTable::Change::NONE);
    EXPECT_EQ(table.size(), 1u);
}

TEST(ClientTableTest, IdenticalLeaseRenewalReportsNoChange)
{
    ClientTable table(30s);
    table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "phone", kStart, 12h);

    auto renewal = table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "phone", kStart + 1h, 12h);

    EXPECT_EQ(renewal.change, ClientTable::Change::NONE);
}

TEST(ClientTableTest, MissingLeaseIsFlaggedOverdueButKept)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);

    EXPECT_TRUE(table.expire(kStart + 29s).empty());

    auto updates = table.expire(kStart + 30s);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].change, ClientTable::Change::UPDATED);
    EXPECT_TRUE(updates[0].record.lease_overdue);
    EXPECT_EQ(table.size(), 1u);

    // flagged once only
    EXPECT_TRUE(table.expire(kStart + 60s).empty());
}

TEST(ClientTableTest, LateLeaseClearsOverdueFlag)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);
    table.expire(kStart + 31s);

    auto update = table.on_lease("aa:bb:cc:00:11:22", "192.168.4.11", "", kStart + 40s, 12h);

    EXPECT_EQ(update.change, ClientTable::Change::UPDATED);
    EXPECT_FALSE(update.record.lease_overdue);
}

TEST(ClientTableTest, ExpiredLeaseDropsAddress)
{
    ClientTable table(30s);
    table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "laptop", kStart, 60s);

    auto updates = table.expire(kStart + 61s);

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_FALSE(updates[0].record.ip.has_value());
    EXPECT_EQ(updates[0].record.hostname, "laptop");
}

TEST(ClientTableTest, InfiniteLeaseNeverExpires)
{
    ClientTable table(30s);
    table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "", kStart, std::chrono::seconds::max());

    EXPECT_TRUE(table.expire(kStart + 24h * 365).empty());
    EXPECT_TRUE(table.find("aa:bb:cc:00:11:22")->ip.has_value());
}

TEST(ClientTableTest, ReleaseKeepsStationButForgetsAddress)
{
    ClientTable table(30s);
    table.on_lease("aa:bb:cc:00:11:22", "192.168.4.10", "", kStart, 12h);

    auto update = table.on_released("aa:bb:cc:00:11:22");

    EXPECT_EQ(update.change, ClientTable::Change::UPDATED);
    EXPECT_FALSE(update.record.ip.has_value());
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.on_released("aa:bb:cc:00:11:22").change, ClientTable::Change::NONE);
}

TEST(ClientTableTest, DisassociationRemovesRecord)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);

    auto update = table.on_disassociated("aa:bb:cc:00:11:22");

    EXPECT_EQ(update.change, ClientTable::Change::LEFT);
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.on_disassociated("aa:bb:cc:00:11:22").change, ClientTable::Change::NONE);
}

TEST(ClientTableTest, SignalUpdatesOnlyKnownStations)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);

    EXPECT_TRUE(table.on_signal("aa:bb:cc:00:11:22", -52));
    EXPECT_FALSE(table.on_signal("aa:bb:cc:00:11:22", -52));
    EXPECT_FALSE(table.on_signal("de:ad:be:ef:00:01", -40));
    EXPECT_EQ(table.find("aa:bb:cc:00:11:22")->signal_dbm, -52);
}

TEST(ClientTableTest, ClearReportsEveryClientLeaving)
{
    ClientTable table(30s);
    table.on_associated("aa:bb:cc:00:11:22", kStart);
    table.on_associated("aa:bb:cc:00:11:33", kStart);

    auto updates = table.clear();

    ASSERT_EQ(updates.size(), 2u);
    for (const auto &update : updates)
    {
        EXPECT_EQ(update.change, ClientTable::Change::LEFT);
    }
    EXPECT_TRUE(table.snapshot().empty());
}
