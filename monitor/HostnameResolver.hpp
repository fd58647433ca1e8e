#pragma once

#include <string>

namespace lan_warden::monitor
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        // Returns "Unknown" when no name can be found.
        virtual std::string Resolve(const std::string &ip) = 0;
    };

    // Reverse DNS through the system resolver.
    class ReverseDnsResolver : public HostnameResolver
    {
    public:
        std::string Resolve(const std::string &ip) override;
    };

    class NullResolver : public HostnameResolver
    {
    public:
        std::string Resolve(const std::string &ip) override;
    };
}
