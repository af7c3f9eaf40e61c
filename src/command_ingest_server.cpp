// =============================================================================
// AutoLink - Command Ingest Server
// =============================================================================
// Route table and lifecycle around httplib::Server. The listening socket is
// bound in start() so bind failures are reported synchronously; the accept
// loop (listen_after_bind) runs on server_thread_.
// =============================================================================
#include "command_ingest_server.hpp"
#include "autolink_log.hpp"

#include <httplib.h>

namespace autolink {

namespace {

constexpr const char* BIND_HOST = "0.0.0.0";
constexpr const char* TEXT_PLAIN = "text/plain; charset=utf-8";

} // namespace

CommandIngestServer::CommandIngestServer(EventBus& bus) : bus_(bus) {}

CommandIngestServer::~CommandIngestServer() {
    stop();
}

std::string CommandIngestServer::echoBody(const std::string& cmd, const std::string& path) {
    return "this command is:" + cmd + "-->" + path;
}

void CommandIngestServer::publishError(const std::string& message) {
    ALOG_ERROR("ingest", "%s", message.c_str());
    IngestErrorEvent evt;
    evt.message = message;
    bus_.publish(evt);
}

// ---------------------------------------------------------------------------
// Routes
// ---------------------------------------------------------------------------

void CommandIngestServer::configureRoutes(httplib::Server& server) {
    server.Get("/exec", [this](const httplib::Request& req, httplib::Response& res) {
        ExecRequestEvent evt;
        evt.cmd = req.get_param_value("cmd");
        evt.path = req.get_param_value("path");

        auto body = std::make_shared<std::string>(echoBody(evt.cmd, evt.path));
        res.status = 200;
        // The releaser runs once the response is on the wire.
        res.set_content_provider(
            body->size(), TEXT_PLAIN,
            [body](size_t offset, size_t length, httplib::DataSink& sink) {
                sink.write(body->data() + offset, length);
                return true;
            },
            [this, evt](bool success) {
                if (!success) ALOG_WARN("ingest", "Failed to send response for %s", evt.cmd.c_str());
                ALOG_INFO("ingest", "exec cmd=%s path=%s", evt.cmd.c_str(), evt.path.c_str());
                bus_.publish(evt);
            });
    });

    // Unknown routes: 404 with no body.
    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        res.body.clear();
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        ALOG_DEBUG("ingest", "%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

bool CommandIngestServer::start(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (server_) return true;

    auto server = std::make_unique<httplib::Server>();
    configureRoutes(*server);
    server->set_read_timeout(CLIENT_TIMEOUT_MS / 1000, (CLIENT_TIMEOUT_MS % 1000) * 1000);
    server->set_payload_max_length(MAX_REQUEST_BYTES);
    // SO_REUSEADDR only: a second listener on the same port must fail to bind
    server->set_socket_options([](httplib::socket_t sock) {
        int yes = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
    });

    int bound = -1;
    if (port == 0) {
        bound = server->bind_to_any_port(BIND_HOST);
    } else if (server->bind_to_port(BIND_HOST, port)) {
        bound = port;
    }
    if (bound < 0) {
        publishError("Failed to bind " + std::string(BIND_HOST) + ":" + std::to_string(port));
        return false;
    }

    server_ = std::move(server);
    port_ = bound;
    running_ = true;

    server_thread_ = std::thread([this]() {
        bool clean = server_->listen_after_bind();
        // stop() clears running_ first; anything else ending the loop is a failure
        if (running_.exchange(false) && !clean) {
            publishError("HTTP listener stopped unexpectedly on port " + std::to_string(port_.load()));
        }
    });
    // stop() is a no-op until the accept loop is running
    server_->wait_until_ready();

    ALOG_INFO("ingest", "Listening on %s:%d", BIND_HOST, bound);
    IngestReadyEvent evt;
    evt.port = bound;
    bus_.publish(evt);
    return true;
}

void CommandIngestServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!server_) return;

    running_ = false;
    server_->stop();
    if (server_thread_.joinable()) server_thread_.join();
    server_.reset();
    ALOG_INFO("ingest", "Stopped");
}

} // namespace autolink
