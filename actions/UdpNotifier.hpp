#pragma once

#include "Actions.hpp"

namespace lan_warden::actions
{
    // Sends the message as a single UDP datagram.
    class UdpNotifier : public NotifyAction
    {
    public:
        explicit UdpNotifier(int port = 9999);

        common::Result Notify(const std::string &ip, const std::string &message) override;

    private:
        int m_port;
    };
}
