#pragma once

#include <optional>
#include "../common/NetworkConfig.hpp"
#include "../common/Types.hpp"

namespace lan_warden::monitor
{
    // Gate for raw observations: drops malformed, broadcast, multicast and
    // self entries, and canonicalises what it lets through.
    class ValidityFilter
    {
    public:
        explicit ValidityFilter(const common::NetworkConfig &config);

        std::optional<common::Observation> Admit(const common::Observation &raw) const;

    private:
        bool IsRejectedIp(uint32_t ip) const;

        common::Ipv4Range m_range;
        std::optional<uint32_t> m_localIp;
    };
}
