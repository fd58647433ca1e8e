#pragma once

#include <memory>
#include <string>
#include "ScanBackend.hpp"
#include "HostnameResolver.hpp"

namespace lan_warden::monitor
{
    // Walks the kernel neighbour cache. Cheap and needs no privilege, but only
    // sees hosts this machine has already talked to.
    class ArpTableBackend : public ScanBackend
    {
    public:
        ArpTableBackend(std::string interface,
                        std::shared_ptr<HostnameResolver> resolver,
                        std::string tablePath = "/proc/net/arp");

        static BackendSlot Create(const std::string &interface,
                                  std::shared_ptr<HostnameResolver> resolver,
                                  const std::string &tablePath = "/proc/net/arp");

        std::string Name() const override { return "arp-table"; }
        ScanResult Scan(const common::Ipv4Range &range) override;

    private:
        std::string m_interface;
        std::shared_ptr<HostnameResolver> m_resolver;
        std::string m_tablePath;
    };
}
