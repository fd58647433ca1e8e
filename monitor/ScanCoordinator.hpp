#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "ScanBackend.hpp"
#include "ValidityFilter.hpp"
#include "DeviceDirectory.hpp"
#include "../common/NetworkConfig.hpp"

namespace lan_warden::monitor
{
    using MergedDevices = std::map<std::string, common::Observation>;

    // Runs every available backend concurrently, merges their output by MAC
    // and feeds the result into the directory.
    //
    // Backends are ordered from coarsest to most detailed; when two report the
    // same MAC, the later one wins. A backend that fails or overruns its
    // timeout contributes nothing for that round.
    class ScanCoordinator
    {
    public:
        ScanCoordinator(const common::NetworkConfig &config,
                        std::vector<BackendSlot> backends,
                        DeviceDirectory &directory,
                        std::chrono::milliseconds backendTimeout,
                        std::vector<std::string> fallbackRanges = DefaultFallbackRanges());

        // One full scan: configured range first, common private ranges only
        // if that produced nothing.
        MergedDevices ScanAndMerge();

        // ScanAndMerge, then update the directory and return its full listing.
        std::vector<common::DeviceRecord> Refresh();

        static std::vector<std::string> DefaultFallbackRanges();

        std::size_t AvailableBackendCount() const;

    private:
        std::vector<ScanResult> RunBackends(const common::Ipv4Range &range);
        void Merge(MergedDevices &merged, const ScanResult &result) const;

        const common::NetworkConfig m_config;
        std::vector<BackendSlot> m_backends;
        DeviceDirectory &m_directory;
        std::chrono::milliseconds m_backendTimeout;
        std::vector<common::Ipv4Range> m_fallbackRanges;
        ValidityFilter m_filter;
    };
}
