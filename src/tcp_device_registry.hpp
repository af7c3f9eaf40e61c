#pragma once
// =============================================================================
// AutoLink - TCP Device Registry
// =============================================================================
// DeviceRegistry over plain TCP, one socket per device session.
//
// Placeholder line transport (one JSON object per line):
//   out: {"type":"command","data":{"command":"run", ...payload}}
//   in:  {"type":"log","data":{"log":"..."}}  or any text line (logged as is)
// The peer closing the socket detaches the device.
// =============================================================================

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "device_registry.hpp"

namespace autolink {

class TcpDeviceRegistry : public DeviceRegistry {
public:
    explicit TcpDeviceRegistry(int connect_timeout_ms = 5000);
    ~TcpDeviceRegistry() override;

    TcpDeviceRegistry(const TcpDeviceRegistry&) = delete;
    TcpDeviceRegistry& operator=(const TcpDeviceRegistry&) = delete;

    void connectTo(const ConnectRequest& request, ConnectCallback on_done) override;

    size_t sendCommand(const std::string& name, const nlohmann::json& payload = {}) override;
    VoidResult sendCommandTo(const std::string& device_id, const std::string& name,
                             const nlohmann::json& payload = {}) override;

    void disconnect() override;

    std::vector<DeviceSession> devices() const override;

    // Connect and reader threads not yet joined. Finished ones are joined
    // on the next spawn.
    size_t workerCount() const;

private:
    struct Session {
        DeviceSession info;
        std::atomic<int> fd{-1};
        std::mutex write_mutex;
    };

    Result<int> openSocket(const std::string& host, int port);
    void readerLoop(std::shared_ptr<Session> session);
    VoidResult writeLine(Session& session, const std::string& line);
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void spawn(std::function<void()> fn);
    void reapWorkers(bool all);

    int connect_timeout_ms_;
    std::atomic<bool> shutting_down_{false};

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;  // device_id -> session

    mutable std::mutex threads_mutex_;
    std::vector<Worker> workers_;
};

} // namespace autolink
