#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "Options.hpp"
#include "../actions/ArpDisconnector.hpp"
#include "../actions/IptablesFirewall.hpp"
#include "../actions/UdpNotifier.hpp"
#include "../common/NetworkConfig.hpp"
#include "../common/Settings.hpp"
#include "../common/TimeFormat.hpp"
#include "../monitor/AccessManager.hpp"
#include "../monitor/ActiveProbeBackend.hpp"
#include "../monitor/ArpTableBackend.hpp"
#include "../monitor/DeviceDirectory.hpp"
#include "../monitor/EnforcementLoop.hpp"
#include "../monitor/HostnameResolver.hpp"
#include "../monitor/ScanCoordinator.hpp"
#include "../store/Blacklist.hpp"
#include "../store/BlacklistStore.hpp"

using namespace lan_warden;
using lan_warden::app::CommandLine;

namespace
{
    volatile std::sig_atomic_t g_stop = 0;

    void HandleSignal(int)
    {
        g_stop = 1;
    }

    void PrintUsage(const char *argv0)
    {
        std::cout << "Usage: " << argv0 << " [options] <command> [args]\n"
                  << "\nCommands:\n"
                  << "  scan                      Scan once and list known devices\n"
                  << "  monitor                   Enforce the blacklist until interrupted\n"
                  << "  block <mac> [reason]      Add a device to the blacklist\n"
                  << "  unblock <mac>             Remove a device from the blacklist\n"
                  << "  blacklist                 Show blacklisted devices\n"
                  << "  message <ip> <text>       Send a message to a device\n"
                  << "  disconnect <mac>          Disconnect a device (root only)\n"
                  << "  info                      Show detected network configuration\n"
                  << "\nOptions:\n"
                  << "  --iface <name>            Interface to scan on\n"
                  << "  --range <cidr>            Network range to scan\n"
                  << "  --db <path>               Blacklist database (default blacklist.db)\n"
                  << "  --interval <seconds>      Monitor scan interval (default 30)\n"
                  << "  --timeout <seconds>       Per-backend scan timeout (default 10)\n"
                  << "  --grace <seconds>         Delay before forced disconnect (default 5)\n"
                  << "  --time-limit <minutes>    Notify devices connected longer than this (0 = off)\n"
                  << "  --notify-port <port>      UDP port for notifications (default 9999)\n";
    }

    void PrintDevices(const std::vector<common::DeviceRecord> &devices)
    {
        if (devices.empty())
        {
            std::cout << "No devices found on the network.\n";
            return;
        }

        std::cout << "\n"
                  << std::left << std::setw(3) << "#" << " "
                  << std::setw(20) << "Hostname" << " "
                  << std::setw(15) << "IP Address" << " "
                  << std::setw(17) << "MAC Address" << " "
                  << std::setw(12) << "Duration" << " "
                  << std::setw(19) << "First Seen" << " "
                  << "Status\n"
                  << std::string(100, '-') << "\n";

        int index = 1;
        for (const auto &device : devices)
        {
            std::string status = device.is_blacklisted ? "BLOCKED" : common::ToString(device.status);
            std::cout << std::left << std::setw(3) << index++ << " "
                      << std::setw(20) << device.hostname.substr(0, 20) << " "
                      << std::setw(15) << device.ip << " "
                      << std::setw(17) << device.mac << " "
                      << std::setw(12) << common::FormatDuration(device.connection_duration) << " "
                      << std::setw(19) << common::FormatTimestamp(device.first_seen) << " "
                      << status << "\n";
        }
    }

    void PrintBlacklist(const store::BlacklistMap &entries)
    {
        if (entries.empty())
        {
            std::cout << "No devices in blacklist\n";
            return;
        }

        for (const auto &pair : entries)
        {
            const auto &entry = pair.second;
            std::cout << "MAC: " << entry.mac << "\n"
                      << "  Reason: " << entry.reason << "\n"
                      << "  Added:  " << entry.timestamp << "\n"
                      << "  IP:     " << (entry.ip ? *entry.ip : "N/A") << "\n";
        }
    }

    int RunCommand(const CommandLine &cmd)
    {
        if (cmd.positional.empty())
            throw std::invalid_argument("missing command");

        const std::string &command = cmd.positional[0];
        const std::vector<std::string> args(cmd.positional.begin() + 1, cmd.positional.end());

        common::MonitorSettings settings = app::BuildSettings(cmd);
        const common::NetworkConfig config = app::BuildNetworkConfig(cmd);
        actions::EffectiveUidCheck privilege;

        if (command == "info")
        {
            std::cout << "Interface:     " << config.interface << "\n"
                      << "Network Range: " << config.range.ToString() << "\n"
                      << "Local IP:      " << (config.local_ip.empty() ? "Unknown" : config.local_ip) << "\n"
                      << "Admin Rights:  " << (privilege.IsElevated() ? "Yes" : "No") << "\n";
            return 0;
        }

        store::BlacklistStore blacklistStore(settings.database_path);
        store::Blacklist blacklist(blacklistStore);
        monitor::DeviceDirectory directory(blacklist, common::SystemClock(), settings.active_window);

        auto resolver = std::make_shared<monitor::ReverseDnsResolver>();
        std::vector<monitor::BackendSlot> backends;
        backends.push_back(monitor::ArpTableBackend::Create(config.interface, resolver));
        backends.push_back(monitor::ActiveProbeBackend::Create(config, resolver, settings.probe_listen));

        monitor::ScanCoordinator coordinator(config, std::move(backends), directory, settings.backend_timeout);

        actions::IptablesFirewall firewall;
        actions::UdpNotifier notifier(settings.notify_port);
        actions::ArpDisconnector disconnector(firewall, config.interface);
        monitor::AccessManager access(directory, blacklist, firewall);

        if (command == "scan")
        {
            std::cout << "Scanning " << config.range.ToString() << " on " << config.interface << "...\n";
            PrintDevices(coordinator.Refresh());
            return 0;
        }

        if (command == "blacklist")
        {
            PrintBlacklist(blacklist.Entries());
            return 0;
        }

        if (command == "block" || command == "unblock" || command == "disconnect")
        {
            if (args.empty())
                throw std::invalid_argument(command + " needs a MAC address");

            // A fresh scan so the device's current IP is known
            coordinator.Refresh();

            common::Result result;
            if (command == "block")
            {
                std::string reason = args.size() > 1 ? args[1] : "Manual blacklist";
                result = access.Add(args[0], reason);
            }
            else if (command == "unblock")
            {
                result = access.Remove(args[0]);
            }
            else
            {
                if (!privilege.IsElevated())
                {
                    std::cerr << "[Main] Admin rights are required to disconnect devices\n";
                    return 1;
                }
                auto device = directory.Find(args[0]);
                if (!device)
                {
                    std::cerr << "[Main] Device " << args[0] << " is not on the network\n";
                    return 1;
                }
                result = disconnector.Disconnect(device->mac, device->ip);
            }

            if (!result)
            {
                std::cerr << "[Main] " << command << " failed: " << result.error << "\n";
                return 1;
            }
            return 0;
        }

        if (command == "message")
        {
            if (args.size() < 2)
                throw std::invalid_argument("message needs an IP address and text");
            common::Result result = notifier.Notify(args[0], args[1]);
            if (!result)
            {
                std::cerr << "[Main] message failed: " << result.error << "\n";
                return 1;
            }
            return 0;
        }

        if (command == "monitor")
        {
            monitor::EnforcementLoop loop(coordinator, directory, blacklist, firewall, notifier, disconnector, privilege, settings);

            std::signal(SIGINT, HandleSignal);
            std::signal(SIGTERM, HandleSignal);

            std::cout << "[Main] Starting auto-monitor mode on " << config.range.ToString()
                      << ". Press Ctrl+C to stop...\n";
            loop.Start();
            while (!g_stop)
                std::this_thread::sleep_for(std::chrono::milliseconds(200));

            std::cout << "[Main] Stopping after the current cycle...\n";
            loop.Stop();
            return 0;
        }

        throw std::invalid_argument("unknown command '" + command + "'");
    }
}

int main(int argc, char **argv)
{
    try
    {
        return RunCommand(app::ParseCommandLine(argc, argv));
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(argv[0]);
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return -1;
    }
}
