// =============================================================================
// AutoLink - Port Lease Cache
// =============================================================================
// Candidates first, then up to MAX_WILDCARD_ATTEMPTS OS-assigned ports.
// Leases live in two generations swapped by rotate().
// =============================================================================
#include "port_lease_cache.hpp"
#include "autolink_log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace autolink {

// =============================================================================
// SocketPortProber
// =============================================================================

ProbeResult SocketPortProber::probe(int port) {
    ProbeResult r;
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        r.error = std::string("socket: ") + std::strerror(errno);
        return r;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, 1) != 0) {
        int e = errno;
        ::close(fd);
        r.status = (e == EADDRINUSE || e == EACCES) ? ProbeStatus::InUse : ProbeStatus::Failed;
        r.error = std::strerror(e);
        return r;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        r.error = std::string("getsockname: ") + std::strerror(errno);
        ::close(fd);
        return r;
    }
    ::close(fd);

    r.status = ProbeStatus::Free;
    r.port = ntohs(addr.sin_port);
    return r;
}

// =============================================================================
// PortLeaseCache
// =============================================================================

PortLeaseCache::PortLeaseCache(std::shared_ptr<PortProber> prober)
    : prober_(prober ? std::move(prober) : std::make_shared<SocketPortProber>()) {}

bool PortLeaseCache::isLeasedLocked(int port) const {
    return current_.count(port) > 0 || previous_.count(port) > 0;
}

PortLeaseCache::Attempt PortLeaseCache::attemptExplicit(int port, std::string& error) {
    ProbeResult r = prober_->probe(port);
    if (r.status == ProbeStatus::InUse) {
        error = r.error;
        return Attempt::InUse;
    }
    if (r.status == ProbeStatus::Failed) {
        error = r.error;
        return Attempt::Failed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (isLeasedLocked(r.port)) {
        error = std::to_string(port) + " is locked";
        return Attempt::Locked;
    }
    current_.insert(r.port);
    return Attempt::Leased;
}

PortLeaseCache::Attempt PortLeaseCache::attemptWildcard(int& port_out, std::string& error) {
    for (int i = 0; i < MAX_WILDCARD_ATTEMPTS; ++i) {
        ProbeResult r = prober_->probe(0);
        if (r.status == ProbeStatus::InUse) {
            error = r.error;
            return Attempt::InUse;
        }
        if (r.status == ProbeStatus::Failed) {
            error = r.error;
            return Attempt::Failed;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!isLeasedLocked(r.port)) {
            current_.insert(r.port);
            port_out = r.port;
            return Attempt::Leased;
        }
        ALOG_TRACE("ports", "OS gave leased port %d, probing again", r.port);
    }
    error = "wildcard probe kept returning leased ports";
    return Attempt::Locked;
}

Result<int> PortLeaseCache::lease(const std::vector<int>& candidates) {
    std::string error;

    for (int port : candidates) {
        if (port == 0) continue;  // the wildcard is always tried last
        switch (attemptExplicit(port, error)) {
            case Attempt::Leased:
                ALOG_DEBUG("ports", "Leased candidate port %d", port);
                return Ok(port);
            case Attempt::InUse:
            case Attempt::Locked:
                ALOG_DEBUG("ports", "Candidate %d unavailable: %s", port, error.c_str());
                continue;
            case Attempt::Failed:
                ALOG_ERROR("ports", "Probe of port %d failed: %s", port, error.c_str());
                return Err<int>(ErrorCode::Io, "probe of port " + std::to_string(port) + " failed: " + error);
        }
    }

    int port = 0;
    switch (attemptWildcard(port, error)) {
        case Attempt::Leased:
            ALOG_DEBUG("ports", "Leased OS-assigned port %d", port);
            return Ok(port);
        case Attempt::Failed:
            ALOG_ERROR("ports", "Wildcard probe failed: %s", error.c_str());
            return Err<int>(ErrorCode::Io, "wildcard probe failed: " + error);
        case Attempt::InUse:
        case Attempt::Locked:
            break;
    }

    ALOG_WARN("ports", "No available ports found (%s)", error.c_str());
    return Err<int>(ErrorCode::NoAvailablePorts, "No available ports found");
}

Result<int> PortLeaseCache::tryLease(int port) {
    std::string error;
    if (port == 0) {
        int leased = 0;
        Attempt a = attemptWildcard(leased, error);
        if (a == Attempt::Leased) return Ok(leased);
        if (a == Attempt::Failed) return Err<int>(ErrorCode::Io, error);
        return Err<int>(ErrorCode::NoAvailablePorts, "No available ports found");
    }

    switch (attemptExplicit(port, error)) {
        case Attempt::Leased:
            return Ok(port);
        case Attempt::Locked:
            return Err<int>(ErrorCode::PortLocked, error);
        case Attempt::InUse:
        case Attempt::Failed:
            break;
    }
    return Err<int>(ErrorCode::Io, "port " + std::to_string(port) + ": " + error);
}

void PortLeaseCache::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    ALOG_TRACE("ports", "Rotating lease window (%zu current, %zu dropped)",
               current_.size(), previous_.size());
    previous_ = std::move(current_);
    current_.clear();
}

void PortLeaseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.clear();
    previous_.clear();
}

bool PortLeaseCache::isLeased(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isLeasedLocked(port);
}

size_t PortLeaseCache::leasedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.size() + previous_.size();
}

} // namespace autolink
