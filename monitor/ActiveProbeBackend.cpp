#include "ActiveProbeBackend.hpp"
#include <tins/tins.h>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <utility>

namespace lan_warden::monitor
{
    ActiveProbeBackend::ActiveProbeBackend(const common::NetworkConfig &config,
                                           std::shared_ptr<HostnameResolver> resolver,
                                           std::chrono::milliseconds listenWindow)
        : m_config(config), m_resolver(std::move(resolver)), m_listenWindow(listenWindow)
    {
    }

    BackendSlot ActiveProbeBackend::Create(const common::NetworkConfig &config,
                                           std::shared_ptr<HostnameResolver> resolver,
                                           std::chrono::milliseconds listenWindow)
    {
        if (geteuid() != 0)
            return UnavailableBackend{"active-probe", "raw sockets need root"};

        try
        {
            Tins::NetworkInterface iface(config.interface);
            Tins::NetworkInterface::Info info = iface.info();
            if (!info.is_up)
                return UnavailableBackend{"active-probe", "interface " + config.interface + " is down"};
        }
        catch (const std::exception &e)
        {
            return UnavailableBackend{"active-probe", "interface " + config.interface + ": " + e.what()};
        }

        return AvailableBackend{std::make_shared<ActiveProbeBackend>(config, std::move(resolver), listenWindow)};
    }

    ScanResult ActiveProbeBackend::Scan(const common::Ipv4Range &range)
    {
        std::map<std::string, std::string> repliesByIp;
        std::mutex repliesMutex;

        try
        {
            Tins::NetworkInterface iface(m_config.interface);
            Tins::NetworkInterface::Info info = iface.info();

            std::vector<uint32_t> targets = range.Hosts(MAX_TARGETS);
            if (targets.size() == MAX_TARGETS)
            {
                std::cerr << "[ActiveProbe] Range " << range.ToString() << " truncated to "
                          << MAX_TARGETS << " targets\n";
            }

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_filter("arp");
            config.set_timeout(100);

            Tins::Sniffer sniffer(iface.name(), config);
            Tins::PacketSender sender;
            std::atomic<bool> stopSniffer(false);

            std::thread snifferThread([&]()
                                      {
                while (!stopSniffer) {
                    try {
                        Tins::Packet packet = sniffer.next_packet();
                        const Tins::PDU *pdu = packet.pdu();
                        if (!pdu)
                            continue;

                        const Tins::ARP *arp = pdu->find_pdu<Tins::ARP>();
                        if (!arp || arp->opcode() != Tins::ARP::REPLY)
                            continue;

                        std::string found_ip = arp->sender_ip_addr().to_string();
                        if (!range.Contains(found_ip))
                            continue;

                        std::lock_guard<std::mutex> lock(repliesMutex);
                        repliesByIp[found_ip] = arp->sender_hw_addr().to_string();
                    } catch (const std::exception &e) {
                        std::cerr << "[ActiveProbe] Capture stopped: " << e.what() << "\n";
                        break;
                    }
                } });

            for (uint32_t target : targets)
            {
                std::string targetStr = common::FormatIpv4(target);
                if (targetStr == m_config.local_ip)
                    continue;

                try
                {
                    Tins::EthernetII eth = Tins::EthernetII(Tins::EthernetII::BROADCAST, info.hw_addr) /
                                           Tins::ARP(Tins::IPv4Address(targetStr), info.ip_addr,
                                                     Tins::ARP::hwaddress_type(), info.hw_addr);
                    sender.send(eth, iface);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[ActiveProbe] Send to " << targetStr << " failed: " << e.what() << "\n";
                }
                std::this_thread::sleep_for(std::chrono::microseconds(300));
            }

            std::this_thread::sleep_for(m_listenWindow);
            stopSniffer = true;

            // Wake the sniffer if the capture is idle
            try
            {
                Tins::EthernetII wake = Tins::EthernetII(info.hw_addr, info.hw_addr) /
                                        Tins::ARP(info.ip_addr, info.ip_addr, info.hw_addr, info.hw_addr);
                sender.send(wake, iface);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ActiveProbe] Wake frame failed: " << e.what() << "\n";
            }

            if (snifferThread.joinable())
                snifferThread.join();
        }
        catch (const std::exception &e)
        {
            return ScanResult::Fail(std::string("sweep failed: ") + e.what());
        }

        std::vector<common::Observation> results;
        results.reserve(repliesByIp.size());
        for (const auto &reply : repliesByIp)
        {
            std::string hostname = m_resolver ? m_resolver->Resolve(reply.first) : common::UNKNOWN_HOSTNAME;
            results.push_back({reply.first, reply.second, hostname});
        }
        return ScanResult::Ok(std::move(results));
    }
}
