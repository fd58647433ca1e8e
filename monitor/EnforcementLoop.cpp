#include "EnforcementLoop.hpp"
#include <iostream>
#include <vector>

namespace lan_warden::monitor
{
    EnforcementLoop::EnforcementLoop(ScanCoordinator &coordinator,
                                     DeviceDirectory &directory,
                                     store::Blacklist &blacklist,
                                     actions::FirewallAction &firewall,
                                     actions::NotifyAction &notifier,
                                     actions::DisconnectAction &disconnector,
                                     const actions::PrivilegeCheck &privilege,
                                     const common::MonitorSettings &settings)
        : m_coordinator(coordinator),
          m_directory(directory),
          m_blacklist(blacklist),
          m_firewall(firewall),
          m_notifier(notifier),
          m_disconnector(disconnector),
          m_privilege(privilege),
          m_settings(settings),
          m_state(LoopState::Idle),
          m_running(false),
          m_stopRequested(false),
          m_cycles(0)
    {
    }

    EnforcementLoop::~EnforcementLoop()
    {
        Stop();
    }

    void EnforcementLoop::Start()
    {
        if (m_running)
            return;
        m_stopRequested = false;
        m_running = true;
        m_thread = std::thread(&EnforcementLoop::Run, this);
    }

    void EnforcementLoop::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_waitMutex);
            m_stopRequested = true;
        }
        m_waitCv.notify_all();

        if (m_thread.joinable())
            m_thread.join();
        m_running = false;
    }

    bool EnforcementLoop::WaitFor(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(m_waitMutex);
        return !m_waitCv.wait_for(lock, duration, [this]
                                  { return m_stopRequested.load(); });
    }

    void EnforcementLoop::Run()
    {
        std::cout << "[Enforcer] Monitoring started, scanning every "
                  << std::chrono::duration_cast<std::chrono::seconds>(m_settings.scan_interval).count() << "s\n";

        // Stop is only honoured between cycles; a cycle always runs to completion.
        while (!m_stopRequested)
        {
            m_state = LoopState::Scanning;
            try
            {
                RunCycle();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Enforcer] Cycle aborted: " << e.what() << "\n";
            }
            m_state = LoopState::Idle;
            ++m_cycles;

            if (!WaitFor(m_settings.scan_interval))
                break;
        }

        std::cout << "[Enforcer] Monitoring stopped\n";
    }

    bool EnforcementLoop::Invoke(const char *what, const std::string &target, CycleReport &report,
                                 const std::function<common::Result()> &action)
    {
        try
        {
            common::Result result = action();
            if (result)
                return true;
            std::cerr << "[Enforcer] " << what << " " << target << " failed: " << result.error << "\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Enforcer] " << what << " " << target << " threw: " << e.what() << "\n";
        }
        ++report.failures;
        return false;
    }

    CycleReport EnforcementLoop::RunCycle()
    {
        CycleReport report;

        // block and unblock run as separate processes against the same database
        m_blacklist.Reload();
        std::vector<common::DeviceRecord> devices = m_coordinator.Refresh();
        report.devices = devices.size();

        bool elevated = m_privilege.IsElevated();
        std::vector<common::DeviceRecord> toDisconnect;

        for (const auto &device : devices)
        {
            if (device.status != common::DeviceStatus::Active)
                continue;

            if (device.is_blacklisted)
            {
                ++report.enforced;
                std::cout << "[Enforcer] Blocking blacklisted device: " << device.ip << " (" << device.mac << ")\n";

                if (Invoke("block", device.ip, report, [&]
                           { return m_firewall.Block(device.ip); }))
                    ++report.blocked;

                if (Invoke("notify", device.ip, report, [&]
                           { return m_notifier.Notify(device.ip, m_settings.block_message); }))
                    ++report.notified;

                if (elevated)
                    toDisconnect.push_back(device);
                else
                    std::cout << "[Enforcer] Admin rights needed to disconnect " << device.ip << " automatically\n";
                continue;
            }

            if (m_settings.time_limit_minutes > 0 &&
                m_directory.ExceedsTimeLimit(device.mac, m_settings.time_limit_minutes))
            {
                if (Invoke("time-limit notice", device.ip, report, [&]
                           { return m_notifier.Notify(device.ip, m_settings.time_limit_message); }))
                    ++report.time_limit_notices;
            }
        }

        if (!toDisconnect.empty())
        {
            std::cout << "[Enforcer] Disconnecting " << toDisconnect.size() << " device(s) in "
                      << std::chrono::duration_cast<std::chrono::seconds>(m_settings.disconnect_grace).count() << " seconds...\n";

            if (!WaitFor(m_settings.disconnect_grace))
            {
                std::cout << "[Enforcer] Stop requested, skipping pending disconnects\n";
                return report;
            }

            for (const auto &device : toDisconnect)
            {
                if (Invoke("disconnect", device.ip, report, [&]
                           { return m_disconnector.Disconnect(device.mac, device.ip); }))
                    ++report.disconnected;
            }
        }

        return report;
    }
}
