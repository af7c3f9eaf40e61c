#pragma once
// =============================================================================
// AutoLink - Session Manager
// =============================================================================
// Owns the process-wide connection state: the task scheduler, the port lease
// cache and the sets of connected devices. Created once by main() and passed
// by reference to the components that need it.
//
// Lifecycle: init() on startup, teardown() on shutdown.
// =============================================================================

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "port_lease_cache.hpp"
#include "task_scheduler.hpp"

namespace autolink {

class SessionManager {
public:
    explicit SessionManager(std::chrono::milliseconds lease_window = std::chrono::milliseconds(15000),
                            std::shared_ptr<PortProber> prober = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool init();
    void teardown();
    bool initialized() const { return rotation_task_ != TaskScheduler::INVALID_TASK; }

    TaskScheduler& scheduler() { return scheduler_; }
    PortLeaseCache& ports() { return ports_; }

    // Connected server-over-adb sessions, keyed by adb serial
    void addAdbDevice(const std::string& adb_id);
    bool hasAdbDevice(const std::string& adb_id) const;

    // Connected server-over-lan sessions, keyed by host
    void addLanHost(const std::string& host);
    bool hasLanHost(const std::string& host) const;

    // Detach: a device leaves both sets
    void removeDevice(const std::string& adb_id, const std::string& host);

    std::vector<std::string> adbDevices() const;
    std::vector<std::string> lanHosts() const;

private:
    std::chrono::milliseconds lease_window_;
    TaskScheduler scheduler_;
    PortLeaseCache ports_;
    TaskScheduler::TaskId rotation_task_ = TaskScheduler::INVALID_TASK;

    mutable std::mutex mutex_;
    std::set<std::string> adb_devices_;
    std::set<std::string> lan_hosts_;
};

} // namespace autolink
