#include "HostnameResolver.hpp"
#include "../common/Types.hpp"
#include <cstring>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>

namespace lan_warden::monitor
{
    std::string ReverseDnsResolver::Resolve(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return common::UNKNOWN_HOSTNAME;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<const struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0 || host[0] == '\0')
            return common::UNKNOWN_HOSTNAME;
        return std::string(host);
    }

    std::string NullResolver::Resolve(const std::string &)
    {
        return common::UNKNOWN_HOSTNAME;
    }
}
