#pragma once

#include <mutex>
#include <string>
#include "DeviceDirectory.hpp"
#include "../actions/Actions.hpp"
#include "../common/Clock.hpp"
#include "../common/Result.hpp"
#include "../store/Blacklist.hpp"

namespace lan_warden::monitor
{
    // Operator-facing blacklist mutations. Persisting the entry is the part
    // that must succeed; the firewall call afterwards is best-effort and is
    // retried by the enforcement loop.
    class AccessManager
    {
    public:
        AccessManager(DeviceDirectory &directory,
                      store::Blacklist &blacklist,
                      actions::FirewallAction &firewall,
                      common::Clock clock = common::SystemClock());

        // Captures the device's current IP so the block can be lifted later.
        common::Result Add(const std::string &mac, const std::string &reason);

        // Unblocks the IP recorded at add time, not the device's live IP.
        common::Result Remove(const std::string &mac);

    private:
        DeviceDirectory &m_directory;
        store::Blacklist &m_blacklist;
        actions::FirewallAction &m_firewall;
        common::Clock m_clock;
        std::mutex m_mutex;
    };
}
