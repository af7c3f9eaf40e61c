// =============================================================================
// AutoLink - TCP Device Registry
// =============================================================================
// One reader thread per session. Connect and reader threads are joined
// once finished (reapWorkers) and all of them on destruction.
// =============================================================================
#include "tcp_device_registry.hpp"
#include "autolink_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace autolink {

namespace {

std::string sessionKey(const ConnectRequest& req) {
    if (req.type == SessionType::ServerOverAdb && !req.adb_device_id.empty()) {
        return req.adb_device_id;
    }
    return req.host + ":" + std::to_string(req.port);
}

} // namespace

TcpDeviceRegistry::TcpDeviceRegistry(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms) {}

TcpDeviceRegistry::~TcpDeviceRegistry() {
    shutting_down_.store(true);
    // A connect finishing during shutdown can still add a session and a reader.
    do {
        disconnect();
        reapWorkers(true);
    } while (workerCount() > 0);
}

void TcpDeviceRegistry::spawn(std::function<void()> fn) {
    reapWorkers(false);
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([fn = std::move(fn), done]() {
        fn();
        done->store(true);
    });
    std::lock_guard<std::mutex> lock(threads_mutex_);
    workers_.push_back(Worker{std::move(t), done});
}

void TcpDeviceRegistry::reapWorkers(bool all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        auto split = std::partition(workers_.begin(), workers_.end(),
            [all](const Worker& w) { return !all && !w.done->load(); });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t TcpDeviceRegistry::workerCount() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return workers_.size();
}

Result<int> TcpDeviceRegistry::openSocket(const std::string& host, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return Err<int>(ErrorCode::InvalidAddress, "not an IPv4 address: " + host);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Err<int>(ErrorCode::ConnectFailed, std::string("socket: ") + std::strerror(errno));
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        int e = errno;
        ::close(fd);
        return Err<int>(ErrorCode::ConnectFailed, std::strerror(e));
    }

    if (rc != 0) {
        pollfd pfd{fd, POLLOUT, 0};
        int pr;
        do {
            pr = ::poll(&pfd, 1, connect_timeout_ms_);
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) {
            ::close(fd);
            return Err<int>(ErrorCode::ConnectionTimeout,
                            "connect to " + host + ":" + std::to_string(port) + " timed out");
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (pr < 0 || so_error != 0) {
            ::close(fd);
            return Err<int>(ErrorCode::ConnectFailed, std::strerror(pr < 0 ? errno : so_error));
        }
    }

    ::fcntl(fd, F_SETFL, flags);
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return Ok(fd);
}

void TcpDeviceRegistry::connectTo(const ConnectRequest& request, ConnectCallback on_done) {
    ALOG_INFO("registry", "Connecting to %s:%d (%s)", request.host.c_str(), request.port,
              sessionTypeName(request.type));

    spawn([this, request, on_done]() {
        auto fd = openSocket(request.host, request.port);
        if (fd.is_err()) {
            ALOG_WARN("registry", "Connect to %s:%d failed: %s", request.host.c_str(),
                      request.port, fd.error().message.c_str());
            if (on_done) on_done(Err<DeviceSession>(fd.error()));
            return;
        }

        if (shutting_down_.load()) {
            ::close(fd.value());
            if (on_done) on_done(Err<DeviceSession>(ErrorCode::ConnectFailed, "registry shutting down"));
            return;
        }

        auto session = std::make_shared<Session>();
        session->fd = fd.value();
        session->info.device_id = sessionKey(request);
        session->info.host = request.host;
        session->info.adb_device_id = request.adb_device_id;
        session->info.type = request.type;
        session->info.display_name = request.type == SessionType::ServerOverAdb
            ? request.adb_device_id
            : request.host;

        std::shared_ptr<Session> replaced;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(session->info.device_id);
            if (it != sessions_.end()) replaced = it->second;
            sessions_[session->info.device_id] = session;
        }
        if (replaced) {
            ALOG_INFO("registry", "Replacing session %s", replaced->info.device_id.c_str());
            ::shutdown(replaced->fd, SHUT_RDWR);
        }

        spawn([this, session]() { readerLoop(session); });

        emitAttached(session->info);
        if (on_done) on_done(Ok(session->info));
    });
}

void TcpDeviceRegistry::readerLoop(std::shared_ptr<Session> session) {
    std::string pending;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(session->fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            nlohmann::json msg = nlohmann::json::parse(line, nullptr, false);
            if (!msg.is_discarded() && msg.is_object() && msg.value("type", "") == "log" &&
                msg.contains("data") && msg["data"].is_object()) {
                emitLog(session->info.device_id, msg["data"].value("log", ""));
            } else {
                emitLog(session->info.device_id, line);
            }
        }
    }

    bool was_current = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->info.device_id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            was_current = true;
        }
    }
    ::close(session->fd.exchange(-1));
    ALOG_INFO("registry", "Session %s closed", session->info.device_id.c_str());
    if (was_current) emitDetached(session->info);
}

VoidResult TcpDeviceRegistry::writeLine(Session& session, const std::string& line) {
    std::lock_guard<std::mutex> lock(session.write_mutex);
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(session.fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            return Err<void>(ErrorCode::Io, std::string("send: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Ok();
}

size_t TcpDeviceRegistry::sendCommand(const std::string& name, const nlohmann::json& payload) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, s] : sessions_) ids.push_back(id);
    }
    size_t sent = 0;
    for (const auto& id : ids) {
        if (sendCommandTo(id, name, payload).is_ok()) ++sent;
    }
    return sent;
}

VoidResult TcpDeviceRegistry::sendCommandTo(const std::string& device_id, const std::string& name,
                                            const nlohmann::json& payload) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(device_id);
        if (it != sessions_.end()) session = it->second;
    }
    if (!session) {
        return Err<void>(ErrorCode::NoDeviceConnected, "no session " + device_id);
    }

    nlohmann::json data = payload.is_object() ? payload : nlohmann::json::object();
    data["command"] = name;
    nlohmann::json msg = {{"type", "command"}, {"data", data}};

    auto r = writeLine(*session, msg.dump() + "\n");
    if (r.is_err()) {
        ALOG_WARN("registry", "Send %s to %s failed: %s", name.c_str(), device_id.c_str(),
                  r.error().message.c_str());
        return r;
    }
    ALOG_DEBUG("registry", "Sent %s to %s", name.c_str(), device_id.c_str());
    return Ok();
}

void TcpDeviceRegistry::disconnect() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, s] : sessions_) all.push_back(s);
    }
    // Readers see EOF, remove the session and publish the detach.
    for (auto& s : all) {
        ::shutdown(s->fd, SHUT_RDWR);
    }
    ALOG_INFO("registry", "Disconnecting %zu session(s)", all.size());
}

std::vector<DeviceSession> TcpDeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceSession> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s->info);
    return out;
}

} // namespace autolink
