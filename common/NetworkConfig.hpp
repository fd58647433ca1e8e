#pragma once

#include <string>
#include "Address.hpp"

namespace lan_warden::common
{
    // Resolved once at start-up and handed to every component that needs it.
    struct NetworkConfig
    {
        std::string interface;
        Ipv4Range range;
        std::string local_ip; // empty when unknown
    };

    class NetworkConfigResolver
    {
    public:
        // Inspects the default-route interface; falls back on failure.
        static NetworkConfig Detect();

        // Same as Detect() for a named interface. If it has no usable IPv4
        // address the name is kept, the range falls back and local_ip is empty.
        static NetworkConfig ForInterface(const std::string &name);

        static NetworkConfig Fallback();

    private:
        NetworkConfigResolver() = delete;
    };
}
