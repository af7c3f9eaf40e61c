// =============================================================================
// AutoLink - Connection Controller
// =============================================================================
#include "connection_controller.hpp"
#include "autolink_log.hpp"

#include <regex>

namespace autolink {

ConnectionController::ConnectionController(SessionManager& sessions, DeviceRegistry& registry,
                                           AddressHistoryStore& history, LanConnectionResolver& lan,
                                           AdbConnectionEstablisher& adb, Notifier& notifier,
                                           Prompter& prompter, InterfaceLister interfaces)
    : sessions_(sessions), registry_(registry), history_(history), lan_(lan), adb_(adb),
      notifier_(notifier), prompter_(prompter), interfaces_(std::move(interfaces)) {}

void ConnectionController::attach() {
    attached_sub_ = registry_.onNewDevice([this](const DeviceAttachedEvent& e) { onAttached(e); });
    detached_sub_ = registry_.onDetachDevice([this](const DeviceDetachedEvent& e) { onDetached(e); });
    log_sub_ = registry_.onLog([this](const DeviceLogEvent& e) { onLog(e); });
}

std::string ConnectionController::ipv4Of(const std::string& remote_address) {
    static const std::regex tail(R"(.*?:?((\d+\.){3}\d+)$)");
    std::smatch m;
    if (std::regex_match(remote_address, m, tail)) return m[1].str();
    return remote_address;
}

// -----------------------------------------------------------------------------
// Registry events
// -----------------------------------------------------------------------------

void ConnectionController::onAttached(const DeviceAttachedEvent& e) {
    const DeviceSession& s = e.session;
    std::string ip = ipv4Of(s.host);
    ALOG_DEBUG("controller", "new device host %s (%s)", ip.c_str(), sessionTypeName(s.type));

    auto recorded = history_.recordAttach(ip);
    if (recorded.is_err()) {
        ALOG_WARN("controller", "history update failed: %s", recorded.error().message.c_str());
    }

    if (s.type == SessionType::ServerOverAdb) {
        sessions_.addAdbDevice(s.adb_device_id);
    } else if (s.type == SessionType::ServerOverLan) {
        sessions_.addLanHost(ip);
    }

    std::string name = s.display_name.empty() ? s.device_id : s.display_name;
    notifier_.info("AutoJs6 device attached: " + name);
}

void ConnectionController::onDetached(const DeviceDetachedEvent& e) {
    const DeviceSession& s = e.session;
    sessions_.removeDevice(s.adb_device_id, ipv4Of(s.host));
    std::string name = s.display_name.empty() ? s.device_id : s.display_name;
    notifier_.info("AutoJs6 device detached: " + name);
}

void ConnectionController::onLog(const DeviceLogEvent& e) {
    std::string tag = "device:" + e.device_id;
    ALOG_INFO(tag.c_str(), "%s", e.line.c_str());
}

// -----------------------------------------------------------------------------
// Menus
// -----------------------------------------------------------------------------

VoidResult ConnectionController::connect() {
    PickRequest req;
    req.title = "Connect";
    req.placeholder = "Choose a connection type";
    req.items = {
        PickItem{MENU_CLIENT_LAN, ""},
        PickItem{MENU_SERVER_LAN, ""},
        PickItem{MENU_SERVER_ADB, ""},
    };

    auto choice = prompter_.pick(req);
    if (!choice) return Ok();

    if (choice->label == MENU_CLIENT_LAN) return showLocalAddress();
    if (choice->label == MENU_SERVER_LAN) return connectLan();
    if (choice->label == MENU_SERVER_ADB) return connectAdb();
    return Ok();
}

VoidResult ConnectionController::connectLan() {
    auto purged = history_.purgeBlacklisted();
    if (purged.is_err()) {
        ALOG_WARN("controller", "history purge failed: %s", purged.error().message.c_str());
    }

    auto records = history_.list();

    PickRequest req;
    req.title = "Connect to the AutoJs6 server over LAN";
    req.placeholder = "Type an IP address or pick a record";
    req.allow_free_text = true;
    for (const auto& r : records) req.items.push_back(PickItem{r.label(), r.detail()});
    if (!records.empty()) req.items.push_back(PickItem{CLEAR_RECORDS, ""});

    auto choice = prompter_.pick(req);
    if (!choice) return Ok();

    if (choice->label == CLEAR_RECORDS) {
        auto cleared = clearHistory();
        if (cleared.is_err()) return Err<void>(cleared.error());
        return Ok();
    }

    ResolveOutcome out = lan_.connectInteractive(*choice);
    if (out.kind == ResolveKind::Failed || out.kind == ResolveKind::Invalid) {
        return Err<void>(out.error ? *out.error : Error{"connect failed", ErrorCode::ConnectFailed});
    }
    return Ok();
}

ResolveOutcome ConnectionController::connectLan(const std::string& address) {
    return lan_.connect(address);
}

Result<size_t> ConnectionController::clearHistory() {
    if (!prompter_.confirm("Clear all saved records?")) return Ok(size_t{0});

    auto cleared = history_.clear();
    if (cleared.is_err()) {
        notifier_.error(cleared.error().message);
        return cleared;
    }
    notifier_.info("Cleared " + std::to_string(cleared.value()) + " record(s)");
    return cleared;
}

VoidResult ConnectionController::connectAdb() {
    auto devices = adb_.enumerate();
    if (devices.empty()) {
        notifier_.error("No device connected through ADB was found");
        return Err<void>(ErrorCode::NoDeviceConnected, "no adb device");
    }

    PickRequest req;
    req.title = "Connect to the AutoJs6 server over ADB";
    req.placeholder = "Choose a device";
    for (const auto& kv : devices) {
        req.items.push_back(PickItem{
            kv.first, "Model: " + kv.second.model + ", Product: " + kv.second.property("product")});
    }

    auto choice = prompter_.pick(req);
    if (!choice) return Ok();
    auto it = devices.find(choice->label);
    if (it == devices.end()) return Ok();

    return adb_.connect(it->second);
}

VoidResult ConnectionController::showLocalAddress() {
    auto ifaces = interfaces_();
    if (ifaces.empty()) {
        notifier_.error("No usable LAN IP address found");
        return Err<void>(ErrorCode::Io, "no LAN interface");
    }

    PickRequest req;
    req.title = "Active network interfaces";
    req.placeholder = "Choose a network interface";
    for (const auto& ni : ifaces) {
        std::string detail = ni.ip4;
        if (!ni.mac.empty()) detail += " | " + ni.mac;
        req.items.push_back(PickItem{ni.name, detail});
    }

    auto choice = prompter_.pick(req);
    if (!choice) return Ok();

    for (const auto& ni : ifaces) {
        if (ni.name == choice->label) {
            notifier_.info("Enable client mode in the AutoJs6 side drawer and connect to " + ni.ip4);
            return Ok();
        }
    }
    return Ok();
}

} // namespace autolink
