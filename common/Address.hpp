#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lan_warden::common
{
    // Canonical form is uppercase and colon separated: AA:BB:CC:DD:EE:FF.
    // Accepts ':' or '-' as separator; anything else is rejected.
    std::optional<std::string> NormalizeMac(const std::string &mac);

    bool IsBroadcastOrMulticastMac(const std::string &canonicalMac);

    // Values are in host byte order.
    std::optional<uint32_t> ParseIpv4(const std::string &ip);
    std::string FormatIpv4(uint32_t ip);

    int MaskToPrefix(uint32_t mask);

    class Ipv4Range
    {
    public:
        Ipv4Range();
        Ipv4Range(uint32_t address, int prefix);

        static std::optional<Ipv4Range> Parse(const std::string &cidr);

        uint32_t Network() const { return m_network; }
        uint32_t Broadcast() const;
        int Prefix() const { return m_prefix; }

        bool Contains(uint32_t ip) const;
        bool Contains(const std::string &ip) const;

        // Usable host addresses, at most `limit` of them.
        std::vector<uint32_t> Hosts(std::size_t limit) const;

        std::string ToString() const;

        bool operator==(const Ipv4Range &other) const
        {
            return m_network == other.m_network && m_prefix == other.m_prefix;
        }
        bool operator!=(const Ipv4Range &other) const { return !(*this == other); }

    private:
        uint32_t Mask() const;

        uint32_t m_network;
        int m_prefix;
    };
}
