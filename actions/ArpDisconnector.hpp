#pragma once

#include <string>
#include "Actions.hpp"

namespace lan_warden::actions
{
    // Blocks the address, then drops the kernel neighbour entry so traffic
    // already in flight stops resolving to the device.
    class ArpDisconnector : public DisconnectAction
    {
    public:
        ArpDisconnector(FirewallAction &firewall, std::string interface);

        common::Result Disconnect(const std::string &mac, const std::string &ip) override;

    private:
        common::Result DeleteNeighbor(const std::string &ip) const;

        FirewallAction &m_firewall;
        std::string m_interface;
    };
}
