#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include "ScanBackend.hpp"
#include "HostnameResolver.hpp"
#include "../common/NetworkConfig.hpp"

namespace lan_warden::monitor
{
    // ARP who-has sweep over the range, collecting replies with a sniffer.
    // Needs raw socket access, so it is only offered when running as root.
    class ActiveProbeBackend : public ScanBackend
    {
    public:
        static constexpr std::size_t MAX_TARGETS = 1024;

        ActiveProbeBackend(const common::NetworkConfig &config,
                           std::shared_ptr<HostnameResolver> resolver,
                           std::chrono::milliseconds listenWindow);

        static BackendSlot Create(const common::NetworkConfig &config,
                                  std::shared_ptr<HostnameResolver> resolver,
                                  std::chrono::milliseconds listenWindow);

        std::string Name() const override { return "active-probe"; }
        ScanResult Scan(const common::Ipv4Range &range) override;

    private:
        const common::NetworkConfig m_config;
        std::shared_ptr<HostnameResolver> m_resolver;
        std::chrono::milliseconds m_listenWindow;
    };
}
