#pragma once
// =============================================================================
// AutoLink - Connection Controller
// =============================================================================
// The "connect" command: a home menu with three ways to reach a device.
//
//   Device as client over LAN  -> show a local address to type on the device
//   Editor as client over LAN  -> address history picker -> LanConnectionResolver
//   Editor as client over ADB  -> device picker -> AdbConnectionEstablisher
//
// Also keeps the address history and the connected-session sets in step with
// the registry's attach/detach events.
// =============================================================================

#include <functional>
#include <string>
#include <vector>
#include "adb_connection_establisher.hpp"
#include "address_history_store.hpp"
#include "device_registry.hpp"
#include "lan_connection_resolver.hpp"
#include "network_interfaces.hpp"
#include "result.hpp"
#include "session_manager.hpp"
#include "ui.hpp"

namespace autolink {

class ConnectionController {
public:
    static constexpr const char* MENU_CLIENT_LAN =
        "[ Connect ] - Server | LAN: AutoJs6 connects to this host as a client (IP address)";
    static constexpr const char* MENU_SERVER_LAN =
        "[ Connect ] - Client | LAN: this host connects to the AutoJs6 server (IP address)";
    static constexpr const char* MENU_SERVER_ADB =
        "[ Connect ] - Client | ADB: this host connects to the AutoJs6 server (ADB)";
    static constexpr const char* CLEAR_RECORDS =
        "[ Clear ] - Record: remove every saved client IP address";

    using InterfaceLister = std::function<std::vector<NetworkInterface>()>;

    ConnectionController(SessionManager& sessions, DeviceRegistry& registry,
                         AddressHistoryStore& history, LanConnectionResolver& lan,
                         AdbConnectionEstablisher& adb, Notifier& notifier, Prompter& prompter,
                         InterfaceLister interfaces = listLanInterfaces);

    // Subscribes to the registry. Subscriptions end with the controller.
    void attach();

    // Home menu
    VoidResult connect();

    VoidResult connectLan();
    ResolveOutcome connectLan(const std::string& address);
    VoidResult connectAdb();
    VoidResult showLocalAddress();

    // Confirms first. Returns the number of records removed (0 when declined).
    Result<size_t> clearHistory();

    // "::ffff:192.168.1.5" -> "192.168.1.5"; unchanged when no IPv4 tail
    static std::string ipv4Of(const std::string& remote_address);

private:
    void onAttached(const DeviceAttachedEvent& e);
    void onDetached(const DeviceDetachedEvent& e);
    void onLog(const DeviceLogEvent& e);

    SessionManager& sessions_;
    DeviceRegistry& registry_;
    AddressHistoryStore& history_;
    LanConnectionResolver& lan_;
    AdbConnectionEstablisher& adb_;
    Notifier& notifier_;
    Prompter& prompter_;
    InterfaceLister interfaces_;

    SubscriptionHandle attached_sub_;
    SubscriptionHandle detached_sub_;
    SubscriptionHandle log_sub_;
};

} // namespace autolink
