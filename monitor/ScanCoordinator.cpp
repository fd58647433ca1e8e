#include "ScanCoordinator.hpp"
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace lan_warden::monitor
{
    ScanCoordinator::ScanCoordinator(const common::NetworkConfig &config,
                                     std::vector<BackendSlot> backends,
                                     DeviceDirectory &directory,
                                     std::chrono::milliseconds backendTimeout,
                                     std::vector<std::string> fallbackRanges)
        : m_config(config),
          m_backends(std::move(backends)),
          m_directory(directory),
          m_backendTimeout(backendTimeout),
          m_filter(config)
    {
        for (const auto &cidr : fallbackRanges)
        {
            auto range = common::Ipv4Range::Parse(cidr);
            if (!range)
            {
                std::cerr << "[Scan] Ignoring malformed fallback range '" << cidr << "'\n";
                continue;
            }
            if (*range != m_config.range)
                m_fallbackRanges.push_back(*range);
        }

        for (const auto &slot : m_backends)
        {
            if (const auto *missing = std::get_if<UnavailableBackend>(&slot))
                std::cerr << "[Scan] Backend " << missing->name << " unavailable: " << missing->reason << "\n";
        }
    }

    std::vector<std::string> ScanCoordinator::DefaultFallbackRanges()
    {
        return {
            "192.168.0.0/24",
            "192.168.1.0/24",
            "192.168.2.0/24",
            "192.168.3.0/24",
            "10.0.0.0/24",
            "172.16.0.0/24"};
    }

    std::size_t ScanCoordinator::AvailableBackendCount() const
    {
        std::size_t count = 0;
        for (const auto &slot : m_backends)
        {
            if (SlotHandle(slot))
                ++count;
        }
        return count;
    }

    std::vector<ScanResult> ScanCoordinator::RunBackends(const common::Ipv4Range &range)
    {
        struct Pending
        {
            std::string name;
            std::future<ScanResult> future;
            std::thread worker;
        };

        std::vector<Pending> pending;
        for (const auto &slot : m_backends)
        {
            std::shared_ptr<ScanBackend> handle = SlotHandle(slot);
            if (!handle)
                continue;

            auto promise = std::make_shared<std::promise<ScanResult>>();
            Pending p;
            p.name = handle->Name();
            p.future = promise->get_future();
            p.worker = std::thread([handle, promise, range]()
                                   {
                try {
                    promise->set_value(handle->Scan(range));
                } catch (const std::exception &e) {
                    promise->set_value(ScanResult::Fail(e.what()));
                } });
            pending.push_back(std::move(p));
        }

        auto deadline = std::chrono::steady_clock::now() + m_backendTimeout;

        std::vector<ScanResult> results;
        for (auto &p : pending)
        {
            if (p.future.wait_until(deadline) != std::future_status::ready)
            {
                std::cerr << "[Scan] " << p.name << " timed out after " << m_backendTimeout.count() << "ms\n";
                // The worker owns its backend and promise; let it finish on its own.
                p.worker.detach();
                results.push_back(ScanResult::Fail("timed out"));
                continue;
            }

            p.worker.join();
            ScanResult result = p.future.get();
            if (!result.ok)
                std::cerr << "[Scan] " << p.name << " failed: " << result.error << "\n";
            else
                std::cout << "[Scan] " << p.name << " found " << result.observations.size() << " devices\n";
            results.push_back(std::move(result));
        }
        return results;
    }

    void ScanCoordinator::Merge(MergedDevices &merged, const ScanResult &result) const
    {
        if (!result.ok)
            return;

        for (const auto &raw : result.observations)
        {
            auto clean = m_filter.Admit(raw);
            if (clean)
                merged[clean->mac] = *clean;
        }
    }

    MergedDevices ScanCoordinator::ScanAndMerge()
    {
        MergedDevices merged;

        // Results come back in backend order, so richer backends overwrite sparser ones.
        for (const auto &result : RunBackends(m_config.range))
            Merge(merged, result);

        if (merged.empty())
        {
            for (const auto &range : m_fallbackRanges)
            {
                std::cout << "[Scan] Trying range: " << range.ToString() << "\n";
                for (const auto &result : RunBackends(range))
                    Merge(merged, result);
            }
            std::cout << "[Scan] Multi-range scan found " << merged.size() << " devices\n";
        }

        return merged;
    }

    std::vector<common::DeviceRecord> ScanCoordinator::Refresh()
    {
        MergedDevices merged = ScanAndMerge();
        for (const auto &pair : merged)
            m_directory.Update(pair.second);

        std::vector<common::DeviceRecord> devices = m_directory.List();
        std::cout << "[Scan] Total known devices: " << devices.size() << "\n";
        return devices;
    }
}
