#include "session_manager.hpp"
#include "autolink_log.hpp"

namespace autolink {

SessionManager::SessionManager(std::chrono::milliseconds lease_window,
                               std::shared_ptr<PortProber> prober)
    : lease_window_(lease_window)
    , ports_(std::move(prober)) {}

SessionManager::~SessionManager() {
    teardown();
}

bool SessionManager::init() {
    if (initialized()) return true;
    if (!scheduler_.start()) {
        ALOG_ERROR("session", "Scheduler failed to start");
        return false;
    }
    rotation_task_ = scheduler_.scheduleRepeating(lease_window_, [this]() { ports_.rotate(); });
    ALOG_INFO("session", "Initialized (lease window %lld ms)",
              static_cast<long long>(lease_window_.count()));
    return true;
}

void SessionManager::teardown() {
    if (!initialized()) return;
    scheduler_.cancel(rotation_task_);
    rotation_task_ = TaskScheduler::INVALID_TASK;
    scheduler_.stop();
    ports_.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        adb_devices_.clear();
        lan_hosts_.clear();
    }
    ALOG_INFO("session", "Torn down");
}

void SessionManager::addAdbDevice(const std::string& adb_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    adb_devices_.insert(adb_id);
}

bool SessionManager::hasAdbDevice(const std::string& adb_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adb_devices_.count(adb_id) > 0;
}

void SessionManager::addLanHost(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    lan_hosts_.insert(host);
}

bool SessionManager::hasLanHost(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lan_hosts_.count(host) > 0;
}

void SessionManager::removeDevice(const std::string& adb_id, const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!adb_id.empty()) adb_devices_.erase(adb_id);
    if (!host.empty()) lan_hosts_.erase(host);
}

std::vector<std::string> SessionManager::adbDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {adb_devices_.begin(), adb_devices_.end()};
}

std::vector<std::string> SessionManager::lanHosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {lan_hosts_.begin(), lan_hosts_.end()};
}

} // namespace autolink
