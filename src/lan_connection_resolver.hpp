#pragma once
// =============================================================================
// AutoLink - LAN Connection Resolver
// =============================================================================
// Turns a typed or picked address into a server-over-lan session.
//
//   text -> strip display prefix -> dotted-quad check -> default port
//        -> registry.connectTo(host, default_port, ServerOverLan)
//
// The transport always uses the default client port; a different :port in
// the text is ignored with a warning.
// =============================================================================

#include <optional>
#include <string>
#include <vector>
#include "device_registry.hpp"
#include "result.hpp"
#include "ui.hpp"

namespace autolink {

struct ValidatedAddress {
    std::string host;
    int port = 0;
    std::string ignored_port;  // non-empty when the text carried another port
};

enum class ResolveKind {
    Connected,
    Failed,
    Invalid,
    Cancelled,
    NeedsDisambiguation,
};

struct ResolveOutcome {
    ResolveKind kind = ResolveKind::Cancelled;
    std::optional<ValidatedAddress> address;
    std::optional<DeviceSession> session;
    std::vector<PickItem> candidates;  // NeedsDisambiguation only
    std::optional<Error> error;
};

class LanConnectionResolver {
public:
    static constexpr const char* AMBIGUOUS_TITLE = "IP address is ambiguous, please confirm";

    LanConnectionResolver(DeviceRegistry& registry, Notifier& notifier, Prompter& prompter,
                          int default_port, int connect_wait_ms = 10000);

    // Pure check, no notifications.
    static Result<ValidatedAddress> validate(const std::string& text, int default_port);
    static bool matchesAddressPattern(const std::string& text);

    // validate() plus the ignored-port warning.
    Result<ValidatedAddress> resolve(const std::string& text);

    // Picker choice -> NeedsDisambiguation when the typed text is a proper
    // substring of the chosen record, otherwise the connect attempt.
    ResolveOutcome connect(const PickResult& choice);

    // Text -> connect attempt, no ambiguity check.
    ResolveOutcome connect(const std::string& text);

    // connect(choice), asking the user once more on ambiguity.
    ResolveOutcome connectInteractive(const PickResult& choice);

    static std::vector<PickItem> ambiguityCandidates(const PickResult& choice);

private:
    DeviceRegistry& registry_;
    Notifier& notifier_;
    Prompter& prompter_;
    int default_port_;
    int connect_wait_ms_;
};

} // namespace autolink
