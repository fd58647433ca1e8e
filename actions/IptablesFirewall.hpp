#pragma once

#include <string>
#include <vector>
#include "Actions.hpp"

namespace lan_warden::actions
{
    // Drops INPUT from and OUTPUT to the address. Each rule is checked with -C
    // before it is appended, so repeated blocks never stack duplicate rules.
    class IptablesFirewall : public FirewallAction
    {
    public:
        explicit IptablesFirewall(std::string binary = "iptables");

        common::Result Block(const std::string &ip) override;
        common::Result Unblock(const std::string &ip) override;

    private:
        static std::vector<std::vector<std::string>> RulesFor(const std::string &ip);

        // Exit status of the command, or -1 if it could not be run
        int Run(const std::string &op, const std::vector<std::string> &rule) const;

        std::string m_binary;
    };
}
