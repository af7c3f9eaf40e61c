#pragma once
// =============================================================================
// AutoLink - Command Ingest Server
// =============================================================================
// HTTP listener (cpp-httplib) that lets a device trigger editor actions.
// Listens on 0.0.0.0:<port> (default 10347).
//
//   GET /exec?cmd=<name>&path=<path>  -> 200 text/plain "this command is:<cmd>--><path>"
//                                        then ExecRequestEvent{cmd, path}
//   anything else                     -> 404, empty body, no event
//
// Listener state goes out as IngestReadyEvent{port} / IngestErrorEvent{message}.
// ExecRequestEvent is published after the response has been written.
// =============================================================================

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "event_bus.hpp"

namespace httplib {
class Server;
}

namespace autolink {

class CommandIngestServer {
public:
    static constexpr int DEFAULT_PORT = 10347;
    static constexpr size_t MAX_REQUEST_BYTES = 16 * 1024;
    static constexpr int CLIENT_TIMEOUT_MS = 5000;

    explicit CommandIngestServer(EventBus& bus);
    ~CommandIngestServer();

    CommandIngestServer(const CommandIngestServer&) = delete;
    CommandIngestServer& operator=(const CommandIngestServer&) = delete;

    // port 0 picks a free port (see port())
    bool start(int port = DEFAULT_PORT);
    void stop();
    bool is_running() const { return running_.load(); }
    int port() const { return port_.load(); }

    static std::string echoBody(const std::string& cmd, const std::string& path);

private:
    void configureRoutes(httplib::Server& server);
    void publishError(const std::string& message);

    EventBus& bus_;
    std::mutex mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<int> port_{0};
    std::atomic<bool> running_{false};
};

} // namespace autolink
