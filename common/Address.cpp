#include "Address.hpp"
#include <arpa/inet.h>
#include <cctype>
#include <sstream>

namespace lan_warden::common
{
    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    }

    std::optional<std::string> NormalizeMac(const std::string &mac)
    {
        if (mac.size() != 17)
            return std::nullopt;

        char separator = mac[2];
        if (separator != ':' && separator != '-')
            return std::nullopt;

        std::string out;
        out.reserve(17);
        for (std::size_t i = 0; i < mac.size(); ++i)
        {
            if (i % 3 == 2)
            {
                if (mac[i] != separator)
                    return std::nullopt;
                out.push_back(':');
                continue;
            }
            if (HexValue(mac[i]) < 0)
                return std::nullopt;
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(mac[i]))));
        }
        return out;
    }

    bool IsBroadcastOrMulticastMac(const std::string &canonicalMac)
    {
        if (canonicalMac == "FF:FF:FF:FF:FF:FF" || canonicalMac == "00:00:00:00:00:00")
            return true;

        // I/G bit of the first octet marks group addresses
        int firstOctet = HexValue(canonicalMac[0]) * 16 + HexValue(canonicalMac[1]);
        return (firstOctet & 0x01) != 0;
    }

    std::optional<uint32_t> ParseIpv4(const std::string &ip)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(uint32_t ip)
    {
        struct in_addr addr;
        addr.s_addr = htonl(ip);
        char buf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr, buf, sizeof(buf));
        return std::string(buf);
    }

    int MaskToPrefix(uint32_t mask)
    {
        int prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;
        return prefix;
    }

    Ipv4Range::Ipv4Range() : m_network(0), m_prefix(32) {}

    Ipv4Range::Ipv4Range(uint32_t address, int prefix)
        : m_network(0), m_prefix(prefix < 0 ? 0 : (prefix > 32 ? 32 : prefix))
    {
        m_network = address & Mask();
    }

    std::optional<Ipv4Range> Ipv4Range::Parse(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        std::string addressPart = cidr.substr(0, slash);
        int prefix = 32;

        if (slash != std::string::npos)
        {
            std::string prefixPart = cidr.substr(slash + 1);
            if (prefixPart.empty() || prefixPart.size() > 2)
                return std::nullopt;
            for (char c : prefixPart)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
            }
            prefix = std::stoi(prefixPart);
            if (prefix > 32)
                return std::nullopt;
        }

        auto address = ParseIpv4(addressPart);
        if (!address)
            return std::nullopt;
        return Ipv4Range(*address, prefix);
    }

    uint32_t Ipv4Range::Mask() const
    {
        if (m_prefix == 0)
            return 0;
        return 0xFFFFFFFFu << (32 - m_prefix);
    }

    uint32_t Ipv4Range::Broadcast() const
    {
        return m_network | ~Mask();
    }

    bool Ipv4Range::Contains(uint32_t ip) const
    {
        return (ip & Mask()) == m_network;
    }

    bool Ipv4Range::Contains(const std::string &ip) const
    {
        auto parsed = ParseIpv4(ip);
        return parsed && Contains(*parsed);
    }

    std::vector<uint32_t> Ipv4Range::Hosts(std::size_t limit) const
    {
        std::vector<uint32_t> hosts;
        uint32_t first = m_network;
        uint32_t last = Broadcast();

        // /31 and /32 have no network or broadcast address to skip
        if (m_prefix < 31)
        {
            ++first;
            --last;
        }

        for (uint64_t ip = first; ip <= last && hosts.size() < limit; ++ip)
            hosts.push_back(static_cast<uint32_t>(ip));
        return hosts;
    }

    std::string Ipv4Range::ToString() const
    {
        std::stringstream ss;
        ss << FormatIpv4(m_network) << "/" << m_prefix;
        return ss.str();
    }
}
