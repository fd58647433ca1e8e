#include "ArpDisconnector.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <net/if_arp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace lan_warden::actions
{
    ArpDisconnector::ArpDisconnector(FirewallAction &firewall, std::string interface)
        : m_firewall(firewall), m_interface(std::move(interface))
    {
    }

    common::Result ArpDisconnector::DeleteNeighbor(const std::string &ip) const
    {
        struct arpreq req;
        std::memset(&req, 0, sizeof(req));

        auto *pa = reinterpret_cast<struct sockaddr_in *>(&req.arp_pa);
        pa->sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &pa->sin_addr) != 1)
            return common::Result::Fail("invalid address '" + ip + "'");

        std::strncpy(req.arp_dev, m_interface.c_str(), sizeof(req.arp_dev) - 1);

        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0)
            return common::Result::Fail(std::string("socket: ") + std::strerror(errno));

        int rc = ioctl(fd, SIOCDARP, &req);
        int ioctlErrno = errno;
        close(fd);

        // No cached entry is already the state we want
        if (rc < 0 && ioctlErrno != ENXIO)
            return common::Result::Fail(std::string("SIOCDARP: ") + std::strerror(ioctlErrno));
        return common::Result::Ok();
    }

    common::Result ArpDisconnector::Disconnect(const std::string &mac, const std::string &ip)
    {
        common::Result blocked = m_firewall.Block(ip);
        if (!blocked)
            return common::Result::Fail("block failed: " + blocked.error);

        common::Result flushed = DeleteNeighbor(ip);
        if (!flushed)
            return common::Result::Fail("neighbour flush failed: " + flushed.error);

        std::cout << "[Disconnect] Disconnected device " << mac << " (" << ip << ")\n";
        return common::Result::Ok();
    }
}
