#include "ArpTableBackend.hpp"
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <utility>

namespace lan_warden::monitor
{
    namespace
    {
        // ATF_COM: the entry has a resolved hardware address
        constexpr unsigned long ARP_FLAG_COMPLETE = 0x2;
    }

    ArpTableBackend::ArpTableBackend(std::string interface,
                                     std::shared_ptr<HostnameResolver> resolver,
                                     std::string tablePath)
        : m_interface(std::move(interface)),
          m_resolver(std::move(resolver)),
          m_tablePath(std::move(tablePath))
    {
    }

    BackendSlot ArpTableBackend::Create(const std::string &interface,
                                        std::shared_ptr<HostnameResolver> resolver,
                                        const std::string &tablePath)
    {
        std::ifstream probe(tablePath);
        if (!probe.is_open())
            return UnavailableBackend{"arp-table", "cannot read " + tablePath};

        return AvailableBackend{std::make_shared<ArpTableBackend>(interface, std::move(resolver), tablePath)};
    }

    ScanResult ArpTableBackend::Scan(const common::Ipv4Range &range)
    {
        std::ifstream arpFile(m_tablePath);
        if (!arpFile.is_open())
            return ScanResult::Fail("cannot open " + m_tablePath);

        std::vector<common::Observation> results;
        std::string line;
        std::getline(arpFile, line);
        while (std::getline(arpFile, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            if (!m_interface.empty() && dev != m_interface)
                continue;

            unsigned long flagBits = 0;
            try
            {
                flagBits = std::stoul(flags, nullptr, 16);
            }
            catch (const std::exception &)
            {
                continue;
            }
            if (!(flagBits & ARP_FLAG_COMPLETE))
                continue;

            if (!range.Contains(ip))
                continue;

            std::string hostname = m_resolver ? m_resolver->Resolve(ip) : common::UNKNOWN_HOSTNAME;
            results.push_back({ip, mac, hostname});
        }
        return ScanResult::Ok(std::move(results));
    }
}
