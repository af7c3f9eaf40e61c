#pragma once
// =============================================================================
// AutoLink - Port Lease Cache
// =============================================================================
// Hands out local TCP port numbers for adb forwards without giving the same
// number twice in quick succession. A leased port stays reserved for one to
// two lease windows: rotate() moves the current window to the previous one
// and drops the old previous window.
//
// The OS is asked first (bind + listen + close on 0.0.0.0), the cache second.
// =============================================================================

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "result.hpp"

namespace autolink {

enum class ProbeStatus {
    Free,    // bound and released, port holds the OS answer
    InUse,   // EADDRINUSE / EACCES
    Failed,  // anything else
};

struct ProbeResult {
    ProbeStatus status = ProbeStatus::Failed;
    int port = 0;
    std::string error;
};

// Asks the OS whether a port can be bound. port 0 = let the OS pick.
class PortProber {
public:
    virtual ~PortProber() = default;
    virtual ProbeResult probe(int port) = 0;
};

class SocketPortProber : public PortProber {
public:
    ProbeResult probe(int port) override;
};

class PortLeaseCache {
public:
    // Upper bound on wildcard re-probes that keep landing on leased ports.
    static constexpr int MAX_WILDCARD_ATTEMPTS = 64;

    explicit PortLeaseCache(std::shared_ptr<PortProber> prober = nullptr);

    // Tries each candidate in order, then the OS wildcard.
    // Errors: NoAvailablePorts, or Io when the prober fails unexpectedly.
    Result<int> lease(const std::vector<int>& candidates = {});

    // Single explicit probe. Errors: PortLocked if the cache holds the port,
    // Io if the OS refuses it.
    Result<int> tryLease(int port);

    void rotate();
    void clear();

    bool isLeased(int port) const;
    size_t leasedCount() const;

private:
    enum class Attempt { Leased, InUse, Locked, Failed };

    Attempt attemptExplicit(int port, std::string& error);
    Attempt attemptWildcard(int& port_out, std::string& error);
    bool isLeasedLocked(int port) const;

    std::shared_ptr<PortProber> prober_;
    mutable std::mutex mutex_;
    std::set<int> current_;
    std::set<int> previous_;
};

} // namespace autolink
