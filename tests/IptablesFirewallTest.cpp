#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <sys/stat.h>
#include "../actions/IptablesFirewall.hpp"
#include "TestDoubles.hpp"

using namespace lan_warden;

namespace
{
    // Stands in for iptables: logs each invocation and keeps the rule table
    // in a text file, one rule per line. -D removes a single matching line.
    const char *FAKE_IPTABLES = R"SH(#!/bin/sh
dir=$(dirname "$0")
printf '%s\n' "$*" >> "$dir/calls"
op="$1"
shift
rule="$*"
touch "$dir/rules"
case "$op" in
  -C) grep -qxF -- "$rule" "$dir/rules" ;;
  -A) printf '%s\n' "$rule" >> "$dir/rules" ;;
  -D) awk -v r="$rule" '!done && $0 == r { done = 1; next } { print }' "$dir/rules" > "$dir/rules.new" && mv "$dir/rules.new" "$dir/rules" ;;
  *) exit 2 ;;
esac
)SH";

    std::vector<std::string> ReadLines(const std::string &path)
    {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    std::size_t CountOp(const std::vector<std::string> &calls, const std::string &op)
    {
        return std::count_if(calls.begin(), calls.end(), [&](const std::string &call)
                             { return call.rfind(op + " ", 0) == 0; });
    }
}

class IptablesFirewallTest : public ::testing::Test
{
protected:
    IptablesFirewallTest()
    {
        dir.Write("iptables", FAKE_IPTABLES);
        chmod(dir.File("iptables").c_str(), 0755);
    }

    std::vector<std::string> Calls() const { return ReadLines(dir.File("calls")); }
    std::vector<std::string> Rules() const { return ReadLines(dir.File("rules")); }

    test::TempDir dir;
};

TEST_F(IptablesFirewallTest, RepeatedBlockAppendsEachRuleOnce)
{
    actions::IptablesFirewall firewall(dir.File("iptables"));

    ASSERT_TRUE(firewall.Block("192.168.1.5"));
    ASSERT_TRUE(firewall.Block("192.168.1.5"));

    std::vector<std::string> rules = Rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0], "INPUT -s 192.168.1.5 -j DROP");
    EXPECT_EQ(rules[1], "OUTPUT -d 192.168.1.5 -j DROP");
    EXPECT_EQ(CountOp(Calls(), "-A"), 2u);
}

TEST_F(IptablesFirewallTest, UnblockOfUnblockedAddressRunsNoDelete)
{
    actions::IptablesFirewall firewall(dir.File("iptables"));

    ASSERT_TRUE(firewall.Unblock("192.168.1.5"));

    std::vector<std::string> calls = Calls();
    EXPECT_EQ(CountOp(calls, "-C"), 2u);
    EXPECT_EQ(CountOp(calls, "-D"), 0u);
}

TEST_F(IptablesFirewallTest, UnblockRemovesDuplicatedRules)
{
    dir.Write("rules", "INPUT -s 192.168.1.5 -j DROP\n"
                       "INPUT -s 192.168.1.5 -j DROP\n"
                       "OUTPUT -d 192.168.1.5 -j DROP\n"
                       "INPUT -s 192.168.1.9 -j DROP\n");
    actions::IptablesFirewall firewall(dir.File("iptables"));

    ASSERT_TRUE(firewall.Unblock("192.168.1.5"));
    ASSERT_TRUE(firewall.Unblock("192.168.1.5"));

    std::vector<std::string> rules = Rules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0], "INPUT -s 192.168.1.9 -j DROP");
    EXPECT_EQ(CountOp(Calls(), "-D"), 3u);
}

TEST_F(IptablesFirewallTest, InvalidAddressIsRejectedWithoutRunningIptables)
{
    actions::IptablesFirewall firewall(dir.File("iptables"));

    EXPECT_FALSE(firewall.Block("192.168.1.300").ok);
    EXPECT_FALSE(firewall.Unblock("not-an-ip").ok);
    EXPECT_TRUE(Calls().empty());
}

TEST_F(IptablesFirewallTest, FailingAppendIsReported)
{
    actions::IptablesFirewall firewall(dir.File("missing-iptables"));

    common::Result blocked = firewall.Block("192.168.1.5");
    EXPECT_FALSE(blocked.ok);
    EXPECT_NE(blocked.error.find("-A INPUT"), std::string::npos);
}
