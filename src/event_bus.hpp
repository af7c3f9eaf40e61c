// =============================================================================
// AutoLink - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the device registry, the ingest server and the dispatcher.
// Usage:
//   auto sub = bus.subscribe<ExecRequestEvent>([](const ExecRequestEvent& e) { ... });
//   ExecRequestEvent evt;
//   evt.cmd = "run";
//   bus.publish(evt);
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include "autolink_log.hpp"

namespace autolink {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// How a session was established. Values match the device-side tags.
enum class SessionType : int {
    ClientOverLan = 0,  // device connected to us over LAN
    ServerOverLan = 1,  // we connected to the device's server over LAN
    ServerOverAdb = 2,  // we connected to the device's server through an adb forward
};

inline const char* sessionTypeName(SessionType t) {
    switch (t) {
        case SessionType::ClientOverLan: return "client-over-lan";
        case SessionType::ServerOverLan: return "server-over-lan";
        case SessionType::ServerOverAdb: return "server-over-adb";
    }
    return "?";
}

struct DeviceSession {
    std::string device_id;      // registry-assigned session key
    std::string host;           // peer IPv4 (127.0.0.1 for adb forwards)
    std::string adb_device_id;  // adb serial, ServerOverAdb only
    SessionType type = SessionType::ServerOverLan;
    std::string display_name;
};

// Device lifecycle (registry -> controller)
struct DeviceAttachedEvent : Event {
    DeviceSession session;
};

struct DeviceDetachedEvent : Event {
    DeviceSession session;
};

struct DeviceLogEvent : Event {
    std::string device_id;
    std::string line;
};

// Command ingest server (server -> dispatcher)
struct IngestReadyEvent : Event {
    int port = 0;
};

struct IngestErrorEvent : Event {
    std::string message;
};

struct ExecRequestEvent : Event {
    std::string cmd;
    std::string path;
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        ALOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                ALOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        auto it = handlers_.find(key);
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace autolink
