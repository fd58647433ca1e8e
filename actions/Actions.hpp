#pragma once

#include <string>
#include "../common/Result.hpp"

namespace lan_warden::actions
{
    // Network-layer block keyed by IP. Block and Unblock must be idempotent.
    class FirewallAction
    {
    public:
        virtual ~FirewallAction() = default;
        virtual common::Result Block(const std::string &ip) = 0;
        virtual common::Result Unblock(const std::string &ip) = 0;
    };

    // Best-effort message to a device.
    class NotifyAction
    {
    public:
        virtual ~NotifyAction() = default;
        virtual common::Result Notify(const std::string &ip, const std::string &message) = 0;
    };

    class DisconnectAction
    {
    public:
        virtual ~DisconnectAction() = default;
        virtual common::Result Disconnect(const std::string &mac, const std::string &ip) = 0;
    };

    class PrivilegeCheck
    {
    public:
        virtual ~PrivilegeCheck() = default;
        virtual bool IsElevated() const = 0;
    };

    class EffectiveUidCheck : public PrivilegeCheck
    {
    public:
        bool IsElevated() const override;
    };
}
