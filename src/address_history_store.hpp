#pragma once
// =============================================================================
// AutoLink - Address History Store
// =============================================================================
// Persisted list of LAN addresses the editor has connected to, most recent
// first. Stored as one JSON file: { "<key>": ["ip|timestampMillis", ...] }.
// Other keys in the file are preserved.
//
// Invariants after every mutation: no loopback or wildcard address, no
// duplicate ip.
// =============================================================================

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "result.hpp"

namespace autolink {

inline constexpr const char* RECORD_PREFIX = "[ Record ] - ";
inline constexpr const char* OPTIONAL_PREFIX = "[ Optional ] - ";

struct AddressRecord {
    std::string ip;
    std::optional<int64_t> last_seen_ms;

    std::string label() const { return RECORD_PREFIX + ip; }
    // "Last connected: yyyy/MM/dd HH:mm:ss" in local time, empty without a timestamp
    std::string detail() const;
};

class AddressHistoryStore {
public:
    static constexpr const char* DEFAULT_KEY = "autojs6.devices";

    explicit AddressHistoryStore(std::string path, std::string key = DEFAULT_KEY);

    std::vector<AddressRecord> list() const;

    // Strips display prefixes, drops duplicate ips (first one wins) and
    // blacklisted addresses, then persists the rest as given.
    VoidResult replace(const std::vector<std::string>& entries);

    // Moves ip to the front with a fresh timestamp, or prepends it.
    // Blacklisted ips are ignored.
    VoidResult recordAttach(const std::string& ip, int64_t now_ms);
    VoidResult recordAttach(const std::string& ip);

    // Returns the number of entries removed.
    Result<size_t> clear();
    Result<size_t> purgeBlacklisted();

    const std::string& path() const { return path_; }

    // "[ Record ] - 10.0.0.2" -> "10.0.0.2"
    static std::string stripDisplayPrefix(const std::string& text);
    // "10.0.0.2|1700000000000" -> "10.0.0.2"
    static std::string ipOf(const std::string& entry);
    static bool isBlacklisted(const std::string& ip);
    static int64_t nowMs();

private:
    std::vector<std::string> loadEntries() const;
    VoidResult storeEntries(const std::vector<std::string>& entries);

    std::string path_;
    std::string key_;
    mutable std::mutex mutex_;
};

} // namespace autolink
