#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "ScanCoordinator.hpp"
#include "DeviceDirectory.hpp"
#include "../actions/Actions.hpp"
#include "../common/Result.hpp"
#include "../common/Settings.hpp"
#include "../store/Blacklist.hpp"

namespace lan_warden::monitor
{
    enum class LoopState
    {
        Idle,
        Scanning
    };

    struct CycleReport
    {
        std::size_t devices = 0;
        std::size_t enforced = 0;
        std::size_t blocked = 0;
        std::size_t notified = 0;
        std::size_t disconnected = 0;
        std::size_t time_limit_notices = 0;
        std::size_t failures = 0;
    };

    class EnforcementLoop
    {
    public:
        EnforcementLoop(ScanCoordinator &coordinator,
                        DeviceDirectory &directory,
                        store::Blacklist &blacklist,
                        actions::FirewallAction &firewall,
                        actions::NotifyAction &notifier,
                        actions::DisconnectAction &disconnector,
                        const actions::PrivilegeCheck &privilege,
                        const common::MonitorSettings &settings);
        ~EnforcementLoop();

        void Start();
        void Stop();

        // One reload, scan, merge and enforcement pass on the calling thread.
        CycleReport RunCycle();

        LoopState State() const { return m_state; }
        std::size_t CompletedCycles() const { return m_cycles; }

    private:
        void Run();

        // Returns false if stop was requested before the wait elapsed.
        bool WaitFor(std::chrono::milliseconds duration);

        bool Invoke(const char *what, const std::string &target, CycleReport &report,
                    const std::function<common::Result()> &action);

        ScanCoordinator &m_coordinator;
        DeviceDirectory &m_directory;
        store::Blacklist &m_blacklist;
        actions::FirewallAction &m_firewall;
        actions::NotifyAction &m_notifier;
        actions::DisconnectAction &m_disconnector;
        const actions::PrivilegeCheck &m_privilege;
        const common::MonitorSettings m_settings;

        std::atomic<LoopState> m_state;
        std::atomic<bool> m_running;
        std::atomic<bool> m_stopRequested;
        std::atomic<std::size_t> m_cycles;
        std::thread m_thread;

        std::mutex m_waitMutex;
        std::condition_variable m_waitCv;
    };
}
