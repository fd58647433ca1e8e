#include <gtest/gtest.h>
#include "../common/Address.hpp"
#include "../common/NetworkConfig.hpp"
#include "../common/TimeFormat.hpp"
#include "../monitor/ValidityFilter.hpp"
#include "TestDoubles.hpp"

using namespace lan_warden;
using lan_warden::test::Obs;

TEST(NormalizeMac, CanonicalisesCaseAndSeparator)
{
    EXPECT_EQ(common::NormalizeMac("aa:bb:cc:dd:ee:01").value_or(""), "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(common::NormalizeMac("aa-bb-cc-dd-ee-01").value_or(""), "AA:BB:CC:DD:EE:01");
}

TEST(NormalizeMac, RejectsMalformedInput)
{
    EXPECT_FALSE(common::NormalizeMac("Unknown"));
    EXPECT_FALSE(common::NormalizeMac("aa:bb:cc:dd:ee"));
    EXPECT_FALSE(common::NormalizeMac("aa:bb-cc:dd:ee:01"));
    EXPECT_FALSE(common::NormalizeMac("gg:bb:cc:dd:ee:01"));
    EXPECT_FALSE(common::NormalizeMac(""));
}

TEST(NormalizeMac, FlagsGroupAddresses)
{
    EXPECT_TRUE(common::IsBroadcastOrMulticastMac("FF:FF:FF:FF:FF:FF"));
    EXPECT_TRUE(common::IsBroadcastOrMulticastMac("00:00:00:00:00:00"));
    EXPECT_TRUE(common::IsBroadcastOrMulticastMac("01:00:5E:00:00:FB"));
    EXPECT_FALSE(common::IsBroadcastOrMulticastMac("AA:BB:CC:DD:EE:01"));
}

TEST(Ipv4Range, ParsesCidrAndMasksHostBits)
{
    auto range = common::Ipv4Range::Parse("192.168.1.77/24");
    ASSERT_TRUE(range);
    EXPECT_EQ(range->ToString(), "192.168.1.0/24");
    EXPECT_EQ(common::FormatIpv4(range->Broadcast()), "192.168.1.255");
    EXPECT_TRUE(range->Contains("192.168.1.200"));
    EXPECT_FALSE(range->Contains("192.168.2.1"));
    EXPECT_FALSE(range->Contains("not-an-ip"));
}

TEST(Ipv4Range, RejectsBadInput)
{
    EXPECT_FALSE(common::Ipv4Range::Parse("192.168.1.0/33"));
    EXPECT_FALSE(common::Ipv4Range::Parse("192.168.1.0/"));
    EXPECT_FALSE(common::Ipv4Range::Parse("192.168.1/24"));
    EXPECT_FALSE(common::Ipv4Range::Parse("192.168.1.0/2x"));
}

TEST(Ipv4Range, HostsSkipNetworkAndBroadcast)
{
    auto range = common::Ipv4Range::Parse("10.0.0.0/30");
    ASSERT_TRUE(range);
    auto hosts = range->Hosts(100);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(common::FormatIpv4(hosts[0]), "10.0.0.1");
    EXPECT_EQ(common::FormatIpv4(hosts[1]), "10.0.0.2");

    EXPECT_EQ(common::Ipv4Range::Parse("10.0.0.0/16")->Hosts(10).size(), 10u);
}

TEST(MaskToPrefix, CountsLeadingOnes)
{
    EXPECT_EQ(common::MaskToPrefix(0xFFFFFF00u), 24);
    EXPECT_EQ(common::MaskToPrefix(0xFFFF0000u), 16);
    EXPECT_EQ(common::MaskToPrefix(0u), 0);
    EXPECT_EQ(common::MaskToPrefix(0xFFFFFFFFu), 32);
}

TEST(FormatDuration, PadsEachField)
{
    EXPECT_EQ(common::FormatDuration(std::chrono::seconds(0)), "00:00:00");
    EXPECT_EQ(common::FormatDuration(std::chrono::seconds(3725)), "01:02:05");
    EXPECT_EQ(common::FormatDuration(std::chrono::seconds(100 * 3600)), "100:00:00");
}

class ValidityFilterTest : public ::testing::Test
{
protected:
    ValidityFilterTest()
    {
        config.interface = "eth0";
        config.range = *common::Ipv4Range::Parse("192.168.1.0/24");
        config.local_ip = "192.168.1.10";
    }

    common::NetworkConfig config;
};

TEST_F(ValidityFilterTest, AdmitsAndCanonicalises)
{
    monitor::ValidityFilter filter(config);
    auto admitted = filter.Admit(Obs("192.168.1.5", "aa-bb-cc-dd-ee-01", ""));
    ASSERT_TRUE(admitted);
    EXPECT_EQ(admitted->mac, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(admitted->ip, "192.168.1.5");
    EXPECT_EQ(admitted->hostname, "Unknown");
}

TEST_F(ValidityFilterTest, RejectsBroadcastAndZeroHardwareAddresses)
{
    monitor::ValidityFilter filter(config);
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.5", "FF:FF:FF:FF:FF:FF")));
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.5", "ff-ff-ff-ff-ff-ff")));
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.5", "00:00:00:00:00:00")));
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.5", "01:00:5e:00:00:01")));
}

TEST_F(ValidityFilterTest, RejectsBroadcastMulticastAndSelf)
{
    monitor::ValidityFilter filter(config);
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.255", "AA:BB:CC:DD:EE:01")));
    EXPECT_FALSE(filter.Admit(Obs("255.255.255.255", "AA:BB:CC:DD:EE:01")));
    EXPECT_FALSE(filter.Admit(Obs("224.0.0.251", "AA:BB:CC:DD:EE:01")));
    EXPECT_FALSE(filter.Admit(Obs("239.255.255.250", "AA:BB:CC:DD:EE:01")));
    EXPECT_FALSE(filter.Admit(Obs("192.168.1.10", "AA:BB:CC:DD:EE:01")));
    EXPECT_FALSE(filter.Admit(Obs("garbage", "AA:BB:CC:DD:EE:01")));
}

TEST_F(ValidityFilterTest, RejectsDirectedBroadcastOfWiderRange)
{
    config.range = *common::Ipv4Range::Parse("10.1.0.0/23");
    config.local_ip = "";
    monitor::ValidityFilter filter(config);
    EXPECT_FALSE(filter.Admit(Obs("10.1.1.255", "AA:BB:CC:DD:EE:01")));
    EXPECT_TRUE(filter.Admit(Obs("10.1.1.254", "AA:BB:CC:DD:EE:01")));
}
