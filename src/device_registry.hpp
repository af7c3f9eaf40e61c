#pragma once
// =============================================================================
// AutoLink - Device Registry interface
// =============================================================================
// The connection subsystem opens, uses and closes device sessions only
// through this interface. The transport behind it (framing, handshake) is the
// implementation's business.
//
// Lifecycle events are delivered on the registry's own bus; subscribers get
// an RAII handle.
// =============================================================================

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "event_bus.hpp"
#include "result.hpp"

namespace autolink {

struct ConnectRequest {
    std::string host;
    int port = 0;
    SessionType type = SessionType::ServerOverLan;
    std::string adb_device_id;  // session key for ServerOverAdb
};

class DeviceRegistry {
public:
    // Called once, from any thread, when the attempt completes.
    using ConnectCallback = std::function<void(const Result<DeviceSession>&)>;

    virtual ~DeviceRegistry() = default;

    // Asynchronous. The attempt is never abandoned by the caller; a slow
    // connect may still complete after the caller stopped waiting.
    virtual void connectTo(const ConnectRequest& request, ConnectCallback on_done) = 0;

    // Returns the number of sessions the command was sent to.
    virtual size_t sendCommand(const std::string& name, const nlohmann::json& payload = {}) = 0;
    virtual VoidResult sendCommandTo(const std::string& device_id, const std::string& name,
                                     const nlohmann::json& payload = {}) = 0;

    // Closes every session; each one produces a detach event.
    virtual void disconnect() = 0;

    virtual std::vector<DeviceSession> devices() const = 0;
    bool hasDevices() const { return !devices().empty(); }

    SubscriptionHandle onNewDevice(std::function<void(const DeviceAttachedEvent&)> fn) {
        return events_.subscribe<DeviceAttachedEvent>(std::move(fn));
    }
    SubscriptionHandle onDetachDevice(std::function<void(const DeviceDetachedEvent&)> fn) {
        return events_.subscribe<DeviceDetachedEvent>(std::move(fn));
    }
    SubscriptionHandle onLog(std::function<void(const DeviceLogEvent&)> fn) {
        return events_.subscribe<DeviceLogEvent>(std::move(fn));
    }

protected:
    void emitAttached(const DeviceSession& s) {
        DeviceAttachedEvent evt;
        evt.session = s;
        events_.publish(evt);
    }
    void emitDetached(const DeviceSession& s) {
        DeviceDetachedEvent evt;
        evt.session = s;
        events_.publish(evt);
    }
    void emitLog(const std::string& device_id, const std::string& line) {
        DeviceLogEvent evt;
        evt.device_id = device_id;
        evt.line = line;
        events_.publish(evt);
    }

private:
    EventBus events_;
};

} // namespace autolink
