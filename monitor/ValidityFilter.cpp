#include "ValidityFilter.hpp"

namespace lan_warden::monitor
{
    ValidityFilter::ValidityFilter(const common::NetworkConfig &config)
        : m_range(config.range), m_localIp(common::ParseIpv4(config.local_ip))
    {
    }

    bool ValidityFilter::IsRejectedIp(uint32_t ip) const
    {
        if (ip == 0 || ip == 0xFFFFFFFFu)
            return true;

        // 224.0.0.0/4
        if ((ip & 0xF0000000u) == 0xE0000000u)
            return true;

        // x.x.x.255 is treated as broadcast regardless of prefix
        if ((ip & 0xFFu) == 0xFFu)
            return true;

        if (m_range.Prefix() < 31 && ip == m_range.Broadcast())
            return true;

        return m_localIp && ip == *m_localIp;
    }

    std::optional<common::Observation> ValidityFilter::Admit(const common::Observation &raw) const
    {
        auto mac = common::NormalizeMac(raw.mac);
        if (!mac || common::IsBroadcastOrMulticastMac(*mac))
            return std::nullopt;

        auto ip = common::ParseIpv4(raw.ip);
        if (!ip || IsRejectedIp(*ip))
            return std::nullopt;

        common::Observation clean;
        clean.mac = *mac;
        clean.ip = common::FormatIpv4(*ip);
        clean.hostname = raw.hostname.empty() ? common::UNKNOWN_HOSTNAME : raw.hostname;
        return clean;
    }
}
