#include "Options.hpp"
#include <chrono>
#include <stdexcept>

namespace lan_warden::app
{
    CommandLine ParseCommandLine(int argc, char **argv)
    {
        CommandLine cmd;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0)
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument("option " + arg + " needs a value");
                cmd.options[arg.substr(2)] = argv[++i];
            }
            else
            {
                cmd.positional.push_back(arg);
            }
        }
        return cmd;
    }

    int ParseNonNegativeInt(const std::string &name, const std::string &value)
    {
        std::size_t used = 0;
        int parsed = -1;
        try
        {
            parsed = std::stoi(value, &used);
        }
        catch (const std::logic_error &)
        {
            used = 0;
        }
        if (used == 0 || used != value.size() || parsed < 0)
            throw std::invalid_argument("--" + name + " expects a non-negative integer");
        return parsed;
    }

    int ParsePort(const std::string &name, const std::string &value)
    {
        int port = ParseNonNegativeInt(name, value);
        if (port < 1 || port > 65535)
            throw std::invalid_argument("--" + name + " expects a port between 1 and 65535");
        return port;
    }

    common::MonitorSettings BuildSettings(const CommandLine &cmd)
    {
        common::MonitorSettings settings;
        for (const auto &opt : cmd.options)
        {
            if (opt.first == "db")
                settings.database_path = opt.second;
            else if (opt.first == "interval")
                settings.scan_interval = std::chrono::seconds(ParseNonNegativeInt(opt.first, opt.second));
            else if (opt.first == "timeout")
                settings.backend_timeout = std::chrono::seconds(ParseNonNegativeInt(opt.first, opt.second));
            else if (opt.first == "grace")
                settings.disconnect_grace = std::chrono::seconds(ParseNonNegativeInt(opt.first, opt.second));
            else if (opt.first == "time-limit")
                settings.time_limit_minutes = ParseNonNegativeInt(opt.first, opt.second);
            else if (opt.first == "notify-port")
                settings.notify_port = ParsePort(opt.first, opt.second);
            else if (opt.first != "iface" && opt.first != "range")
                throw std::invalid_argument("unknown option --" + opt.first);
        }
        return settings;
    }

    common::NetworkConfig BuildNetworkConfig(const CommandLine &cmd)
    {
        // The host address and range must belong to the interface actually used
        auto iface = cmd.options.find("iface");
        common::NetworkConfig config = iface != cmd.options.end()
                                           ? common::NetworkConfigResolver::ForInterface(iface->second)
                                           : common::NetworkConfigResolver::Detect();

        auto range = cmd.options.find("range");
        if (range != cmd.options.end())
        {
            auto parsed = common::Ipv4Range::Parse(range->second);
            if (!parsed)
                throw std::invalid_argument("--range expects CIDR notation, got '" + range->second + "'");
            config.range = *parsed;
        }
        return config;
    }
}
