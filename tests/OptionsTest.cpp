#include <gtest/gtest.h>
#include <stdexcept>
#include "../app/Options.hpp"

using namespace lan_warden;

namespace
{
    app::CommandLine Options(std::map<std::string, std::string> options)
    {
        app::CommandLine cmd;
        cmd.options = std::move(options);
        cmd.positional.push_back("monitor");
        return cmd;
    }
}

TEST(Options, ParsesFlagPairsAndPositionals)
{
    const char *argv[] = {"lan_warden", "--db", "/tmp/x.db", "block", "aa:bb:cc:dd:ee:01", "curfew"};
    app::CommandLine cmd = app::ParseCommandLine(6, const_cast<char **>(argv));

    EXPECT_EQ(cmd.options["db"], "/tmp/x.db");
    ASSERT_EQ(cmd.positional.size(), 3u);
    EXPECT_EQ(cmd.positional[0], "block");
}

TEST(Options, NotifyPortMustFitInSixteenBits)
{
    EXPECT_EQ(app::BuildSettings(Options({{"notify-port", "65535"}})).notify_port, 65535);
    EXPECT_THROW(app::BuildSettings(Options({{"notify-port", "70000"}})), std::invalid_argument);
    EXPECT_THROW(app::BuildSettings(Options({{"notify-port", "0"}})), std::invalid_argument);
}

TEST(Options, MalformedNumbersAreInvalidArguments)
{
    EXPECT_THROW(app::BuildSettings(Options({{"interval", "abc"}})), std::invalid_argument);
    EXPECT_THROW(app::BuildSettings(Options({{"interval", "10s"}})), std::invalid_argument);
    EXPECT_THROW(app::BuildSettings(Options({{"grace", "-1"}})), std::invalid_argument);
    EXPECT_THROW(app::BuildSettings(Options({{"timeout", "99999999999999"}})), std::invalid_argument);
    EXPECT_THROW(app::BuildSettings(Options({{"colour", "1"}})), std::invalid_argument);
}

TEST(Options, TimeLimitIsOffUnlessGiven)
{
    EXPECT_EQ(app::BuildSettings(Options({})).time_limit_minutes, 0);
    EXPECT_EQ(app::BuildSettings(Options({{"time-limit", "45"}})).time_limit_minutes, 45);
}

TEST(Options, InterfaceOverrideDoesNotKeepDefaultHostAddress)
{
    common::NetworkConfig config = app::BuildNetworkConfig(Options({{"iface", "lw-missing0"}}));

    EXPECT_EQ(config.interface, "lw-missing0");
    EXPECT_TRUE(config.local_ip.empty());
    EXPECT_EQ(config.range, common::NetworkConfigResolver::Fallback().range);
}

TEST(Options, RangeOverrideAppliesAfterInterface)
{
    common::NetworkConfig config = app::BuildNetworkConfig(Options({{"iface", "lw-missing0"}, {"range", "10.9.0.0/16"}}));

    EXPECT_EQ(config.range.ToString(), "10.9.0.0/16");
    EXPECT_THROW(app::BuildNetworkConfig(Options({{"range", "10.9.0.0/40"}})), std::invalid_argument);
}
