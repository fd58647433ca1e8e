#pragma once

#include <map>
#include <string>
#include <vector>
#include "../common/NetworkConfig.hpp"
#include "../common/Settings.hpp"

namespace lan_warden::app
{
    // `--name value` pairs plus the remaining positional words
    struct CommandLine
    {
        std::map<std::string, std::string> options;
        std::vector<std::string> positional;
    };

    // All parsers throw std::invalid_argument on bad input.
    CommandLine ParseCommandLine(int argc, char **argv);

    int ParseNonNegativeInt(const std::string &name, const std::string &value);
    int ParsePort(const std::string &name, const std::string &value);

    common::MonitorSettings BuildSettings(const CommandLine &cmd);

    // --iface resolves the named interface instead of the default route.
    common::NetworkConfig BuildNetworkConfig(const CommandLine &cmd);
}
