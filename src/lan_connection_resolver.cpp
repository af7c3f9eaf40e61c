// =============================================================================
// AutoLink - LAN Connection Resolver
// =============================================================================
// Address checks, connect with a bounded wait, failure detail.
// =============================================================================
#include "lan_connection_resolver.hpp"
#include "address_history_store.hpp"
#include "autolink_log.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <regex>

namespace autolink {

namespace {

// Four 0-255 groups (leading zeros allowed), optional :port
const std::regex& addressPattern() {
    static const std::regex re(
        R"(^((25[0-5]|2[0-4]\d|[01]?\d?\d)\.){3}(25[0-5]|2[0-4]\d|[01]?\d?\d)(:(\d+))?$)");
    return re;
}

} // namespace

LanConnectionResolver::LanConnectionResolver(DeviceRegistry& registry, Notifier& notifier,
                                             Prompter& prompter, int default_port,
                                             int connect_wait_ms)
    : registry_(registry)
    , notifier_(notifier)
    , prompter_(prompter)
    , default_port_(default_port)
    , connect_wait_ms_(connect_wait_ms) {}

bool LanConnectionResolver::matchesAddressPattern(const std::string& text) {
    return std::regex_match(text, addressPattern());
}

Result<ValidatedAddress> LanConnectionResolver::validate(const std::string& text, int default_port) {
    std::string host = AddressHistoryStore::stripDisplayPrefix(text);
    std::smatch m;
    if (!std::regex_match(host, m, addressPattern())) {
        return Err<ValidatedAddress>(ErrorCode::InvalidAddress, "cannot parse address " + text);
    }

    ValidatedAddress addr;
    addr.port = default_port;
    auto colon = host.find(':');
    if (colon != std::string::npos) {
        std::string port = m[5].str();
        if (port != std::to_string(default_port)) addr.ignored_port = port;
        host.resize(colon);
    }
    addr.host = host;
    return Ok(addr);
}

Result<ValidatedAddress> LanConnectionResolver::resolve(const std::string& text) {
    auto r = validate(text, default_port_);
    if (r.is_ok() && !r.value().ignored_port.empty()) {
        notifier_.warn("Port " + r.value().ignored_port + " ignored, using " +
                       std::to_string(default_port_));
    }
    return r;
}

std::vector<PickItem> LanConnectionResolver::ambiguityCandidates(const PickResult& choice) {
    const std::string& typed = choice.typed_text;
    std::string pure = AddressHistoryStore::stripDisplayPrefix(choice.label);
    if (typed.empty() || !matchesAddressPattern(typed)) return {};
    if (pure.find(typed) == std::string::npos || pure == typed) return {};
    return {PickItem{OPTIONAL_PREFIX + typed, {}}, PickItem{choice.label, {}}};
}

ResolveOutcome LanConnectionResolver::connect(const PickResult& choice) {
    auto candidates = ambiguityCandidates(choice);
    if (!candidates.empty()) {
        ALOG_DEBUG("lan", "'%s' is ambiguous with '%s'", choice.typed_text.c_str(), choice.label.c_str());
        ResolveOutcome out;
        out.kind = ResolveKind::NeedsDisambiguation;
        out.candidates = std::move(candidates);
        return out;
    }
    return connect(choice.label);
}

ResolveOutcome LanConnectionResolver::connectInteractive(const PickResult& choice) {
    ResolveOutcome first = connect(choice);
    if (first.kind != ResolveKind::NeedsDisambiguation) return first;

    PickRequest req;
    req.title = AMBIGUOUS_TITLE;
    req.placeholder = "Choose an IP address and press Enter to connect";
    req.items = first.candidates;
    auto second = prompter_.pick(req);
    if (!second) {
        ResolveOutcome out;
        out.kind = ResolveKind::Cancelled;
        return out;
    }
    return connect(second->label);
}

ResolveOutcome LanConnectionResolver::connect(const std::string& text) {
    ResolveOutcome out;

    auto addr = resolve(text);
    if (addr.is_err()) {
        notifier_.error("Failed to connect to the AutoJs6 server, cannot parse address " + text);
        out.kind = ResolveKind::Invalid;
        out.error = addr.error();
        return out;
    }
    out.address = addr.value();
    const std::string& host = out.address->host;

    notifier_.info("Connecting to the AutoJs6 server (" + host + ")...");

    ConnectRequest req;
    req.host = host;
    req.port = default_port_;
    req.type = SessionType::ServerOverLan;

    // The registry may call back after we stop waiting; the promise outlives us.
    auto done = std::make_shared<std::promise<Result<DeviceSession>>>();
    auto fut = done->get_future();
    registry_.connectTo(req, [done](const Result<DeviceSession>& r) {
        done->set_value(r);
    });

    Result<DeviceSession> result = Err<DeviceSession>(ErrorCode::ConnectionTimeout,
                                                      "no answer from " + host);
    if (fut.wait_for(std::chrono::milliseconds(connect_wait_ms_)) == std::future_status::ready) {
        result = fut.get();
    }

    if (result.is_ok()) {
        ALOG_INFO("lan", "Connected to %s", host.c_str());
        out.kind = ResolveKind::Connected;
        out.session = result.value();
        return out;
    }

    ALOG_WARN("lan", "Connect to %s failed: %s", host.c_str(), result.error().message.c_str());
    notifier_.error("Unable to connect to the AutoJs6 server (" + host + ")");
    notifier_.detail("AutoJs6 server connection diagnosis", {
        "Check that \"Server mode\" is enabled in the AutoJs6 side drawer",
        "Check that both devices are on the same LAN",
        "Check that the firewall on this machine allows port " + std::to_string(default_port_),
        "Try another way to connect (for example ADB)",
    });
    out.kind = ResolveKind::Failed;
    out.error = result.error();
    return out;
}

} // namespace autolink
