// =============================================================================
// AutoLink - command line entry point
// =============================================================================
// autolink [--config FILE] [--verbose] <command>
//
//   serve           ingest server + dispatcher until SIGINT/SIGTERM
//   connect         interactive connect menu, then serve
//   lan <address>   connect to an AutoJs6 server over LAN, then serve
//   adb             pick an adb device and connect, then serve
//   devices         list adb devices
//   history         list saved LAN addresses
//   history clear   remove every saved LAN address
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "adb_connection_establisher.hpp"
#include "address_history_store.hpp"
#include "autolink_log.hpp"
#include "command_dispatcher.hpp"
#include "command_ingest_server.hpp"
#include "config_loader.hpp"
#include "connection_controller.hpp"
#include "console_ui.hpp"
#include "event_bus.hpp"
#include "lan_connection_resolver.hpp"
#include "script_actions.hpp"
#include "session_manager.hpp"
#include "tcp_device_registry.hpp"

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

void installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // Writes to a closed device socket must not kill the process
    signal(SIGPIPE, SIG_IGN);
}

void printUsage(std::ostream& out) {
    out << "usage: autolink [--config FILE] [--verbose] <command>\n"
           "\n"
           "commands:\n"
           "  serve           run the ingest server until interrupted\n"
           "  connect         interactive connect menu\n"
           "  lan <address>   connect to an AutoJs6 server over LAN\n"
           "  adb             connect to an AutoJs6 server over ADB\n"
           "  devices         list adb devices\n"
           "  history         list saved LAN addresses\n"
           "  history clear   remove every saved LAN address\n";
}

struct CliArgs {
    std::string config_path = "autolink.json";
    bool config_given = false;
    bool verbose = false;
    std::vector<std::string> command;
};

bool parseArgs(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) return false;
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (a == "--verbose" || a == "-v") {
            args.verbose = true;
        } else if (a == "--help" || a == "-h") {
            return false;
        } else {
            args.command.push_back(a);
        }
    }
    return !args.command.empty();
}

int serveUntilSignal(autolink::CommandIngestServer& server, int port) {
    if (!server.is_running() && !server.start(port)) return 1;
    ALOG_INFO("main", "Serving on port %d, Ctrl+C to quit", server.port());
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ALOG_INFO("main", "Shutting down");
    return 0;
}

int run(const CliArgs& args) {
    using namespace autolink;

    config::AppConfig cfg = config::loadConfig(args.config_path, args.config_given);

    autolink::log::setLogLevel(args.verbose ? autolink::log::Level::Debug
                                            : autolink::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !autolink::log::openLogFile(cfg.log.log_path.c_str())) {
        ALOG_WARN("main", "Cannot open log file %s", cfg.log.log_path.c_str());
    }

    ConsoleNotifier notifier(std::cout);
    ConsolePrompter prompter(std::cin, std::cout);

    SessionManager sessions(std::chrono::milliseconds(cfg.ports.lease_window_ms));
    if (!sessions.init()) {
        ALOG_ERROR("main", "Session manager failed to start");
        return 1;
    }

    TcpDeviceRegistry registry(cfg.network.connect_timeout_ms);
    AddressHistoryStore history(cfg.storage.history_path, cfg.storage.history_key);
    LanConnectionResolver lan(registry, notifier, prompter, cfg.network.device_client_port);

    AdbSettings adb_settings;
    adb_settings.device_client_port = cfg.network.device_client_port;
    adb_settings.device_adb_server_port = cfg.network.device_adb_server_port;
    adb_settings.handshake_timeout_ms = cfg.adb.handshake_timeout_ms;
    adb_settings.debug_provider_uri = cfg.adb.debug_provider_uri;
    AdbConnectionEstablisher adb(sessions, registry, notifier,
                                 makeAdbExecutor(cfg.adb.adb_path, cfg.adb.exec_timeout_ms),
                                 adb_settings);

    ConnectionController controller(sessions, registry, history, lan, adb, notifier, prompter);
    controller.attach();

    ScriptActions actions(registry, notifier, prompter);
    CommandDispatcher dispatcher(sessions.scheduler(), notifier, cfg.dispatch.rerun_delay_ms);
    actions.registerWith(dispatcher);
    dispatcher.registerHandler(CommandTag::Connect, [&controller](const CommandDispatcher::Params&) {
        auto r = controller.connect();
        if (r.is_err()) ALOG_DEBUG("main", "connect: %s", r.error().message.c_str());
    });

    EventBus bus;
    auto dispatch_sub = dispatcher.attach(bus);
    auto ready_sub = bus.subscribe<IngestReadyEvent>([](const IngestReadyEvent& e) {
        ALOG_INFO("main", "Ingest server listening on port %d", e.port);
    });
    auto error_sub = bus.subscribe<IngestErrorEvent>([&notifier](const IngestErrorEvent& e) {
        notifier.error("HTTP server error: " + e.message);
    });
    CommandIngestServer server(bus);

    const std::string& cmd = args.command[0];
    int rc = 0;

    if (cmd == "serve") {
        rc = serveUntilSignal(server, cfg.network.http_server_port);
    } else if (cmd == "connect") {
        auto r = controller.connect();
        rc = r.is_err() ? 1 : serveUntilSignal(server, cfg.network.http_server_port);
    } else if (cmd == "lan") {
        if (args.command.size() < 2) {
            printUsage(std::cerr);
            rc = 2;
        } else {
            auto out = controller.connectLan(args.command[1]);
            rc = out.kind == ResolveKind::Connected ? serveUntilSignal(server, cfg.network.http_server_port) : 1;
        }
    } else if (cmd == "adb") {
        auto r = controller.connectAdb();
        rc = r.is_err() ? 1 : serveUntilSignal(server, cfg.network.http_server_port);
    } else if (cmd == "devices") {
        for (const auto& kv : adb.enumerate()) {
            std::cout << kv.first << "  model:" << kv.second.model
                      << " product:" << kv.second.property("product") << "\n";
        }
    } else if (cmd == "history") {
        if (args.command.size() >= 2 && args.command[1] == "clear") {
            auto cleared = controller.clearHistory();
            rc = cleared.is_err() ? 1 : 0;
        } else {
            for (const auto& rec : history.list()) {
                std::cout << rec.label();
                if (rec.last_seen_ms) std::cout << "  (" << rec.detail() << ")";
                std::cout << "\n";
            }
        }
    } else {
        printUsage(std::cerr);
        rc = 2;
    }

    server.stop();
    registry.disconnect();
    sessions.teardown();
    return rc;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(std::cerr);
        return 2;
    }

    installSignalHandlers();

    try {
        int rc = run(args);
        autolink::log::closeLogFile();
        return rc;
    } catch (const std::exception& e) {
        ALOG_FATAL("main", "Unhandled exception: %s", e.what());
        autolink::log::closeLogFile();
        return 1;
    }
}
