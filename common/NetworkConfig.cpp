#include "NetworkConfig.hpp"
#include <tins/tins.h>
#include <iostream>
#include <optional>

namespace lan_warden::common
{
    namespace
    {
        std::optional<NetworkConfig> Describe(const Tins::NetworkInterface &iface)
        {
            Tins::NetworkInterface::Info info = iface.info();

            auto host_ip = ParseIpv4(info.ip_addr.to_string());
            auto host_mask = ParseIpv4(info.netmask.to_string());
            if (!host_ip || !host_mask || *host_ip == 0)
            {
                std::cerr << "[Config] Interface " << iface.name() << " has no IPv4 address, using fallback.\n";
                return std::nullopt;
            }

            NetworkConfig config;
            config.interface = iface.name();
            config.range = Ipv4Range(*host_ip, MaskToPrefix(*host_mask));
            config.local_ip = info.ip_addr.to_string();
            return config;
        }
    }

    NetworkConfig NetworkConfigResolver::Detect()
    {
        try
        {
            if (auto config = Describe(Tins::NetworkInterface::default_interface()))
                return *config;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Config] Network detection error: " << e.what() << "\n";
        }
        return Fallback();
    }

    NetworkConfig NetworkConfigResolver::ForInterface(const std::string &name)
    {
        try
        {
            if (auto config = Describe(Tins::NetworkInterface(name)))
                return *config;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Config] Cannot inspect " << name << ": " << e.what() << "\n";
        }

        NetworkConfig config = Fallback();
        config.interface = name;
        return config;
    }

    NetworkConfig NetworkConfigResolver::Fallback()
    {
        NetworkConfig config;
        config.interface = "wlan0";
        config.range = *Ipv4Range::Parse("192.168.1.0/24");
        config.local_ip = "";
        return config;
    }
}
