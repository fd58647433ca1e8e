#include "UdpNotifier.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace lan_warden::actions
{
    UdpNotifier::UdpNotifier(int port) : m_port(port) {}

    common::Result UdpNotifier::Notify(const std::string &ip, const std::string &message)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(m_port));
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return common::Result::Fail("invalid address '" + ip + "'");

        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0)
            return common::Result::Fail(std::string("socket: ") + std::strerror(errno));

        ssize_t sent = sendto(fd, message.data(), message.size(), 0,
                              reinterpret_cast<const struct sockaddr *>(&addr), sizeof(addr));
        int sendErrno = errno;
        close(fd);

        if (sent < 0)
            return common::Result::Fail(std::string("sendto: ") + std::strerror(sendErrno));

        std::cout << "[Notify] UDP message sent to " << ip << ":" << m_port << "\n";
        return common::Result::Ok();
    }
}
