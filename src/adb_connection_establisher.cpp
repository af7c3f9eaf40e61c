// =============================================================================
// AutoLink - ADB Connection Establisher
// =============================================================================
// Device listing, port forwards and the handshake diagnostic. The handshake
// timer can fire after destruction and checks liveness_ first.
// =============================================================================
#include "adb_connection_establisher.hpp"
#include "autolink_log.hpp"

#include <regex>
#include <sstream>

namespace autolink {

namespace {

constexpr const char* LOOPBACK = "127.0.0.1";
constexpr const char* PROVIDER_MISSING_MARKER = "Could not find provider";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

AdbExecutor makeAdbExecutor(const std::string& adb_path, int timeout_ms) {
    return [adb_path, timeout_ms](const std::vector<std::string>& args) {
        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(adb_path);
        argv.insert(argv.end(), args.begin(), args.end());
        return runProcess(argv, timeout_ms);
    };
}

AdbConnectionEstablisher::AdbConnectionEstablisher(SessionManager& sessions, DeviceRegistry& registry,
                                                   Notifier& notifier, AdbExecutor adb,
                                                   AdbSettings settings)
    : sessions_(sessions)
    , registry_(registry)
    , notifier_(notifier)
    , adb_(std::move(adb))
    , settings_(std::move(settings)) {}

AdbConnectionEstablisher::~AdbConnectionEstablisher() {
    std::lock_guard<std::mutex> lock(liveness_->mutex);
    liveness_->alive = false;
}

// =============================================================================
// Enumeration
// =============================================================================

std::optional<AdbDevice> AdbConnectionEstablisher::parseDeviceLine(const std::string& line) {
    static const std::regex re(R"((\S+)\s+device\s(.+))");
    std::smatch m;
    if (!std::regex_search(line, m, re)) return std::nullopt;

    AdbDevice dev;
    dev.id = m[1].str();
    const std::string props = m[2].str();

    // Each "key:" runs until the last space before the next "key:".
    size_t key_start = 0;
    size_t colon = props.find(':');
    while (colon != std::string::npos) {
        size_t next = props.find(':', colon + 1);
        size_t value_end = props.size();
        size_t following = std::string::npos;
        while (next != std::string::npos) {
            size_t space = props.rfind(' ', next);
            if (space != std::string::npos && space > colon) {
                value_end = space;
                following = space + 1;
                break;
            }
            next = props.find(':', next + 1);  // colon inside the value
        }

        std::string key = trim(props.substr(key_start, colon - key_start));
        std::string value = trim(props.substr(colon + 1, value_end - colon - 1));
        if (!key.empty()) dev.properties[key] = value;

        if (following == std::string::npos) break;
        key_start = following;
        colon = next;
    }

    auto model = dev.properties.find("model");
    if (model != dev.properties.end() && !model->second.empty()) dev.model = model->second;
    return dev;
}

std::map<std::string, AdbDevice> AdbConnectionEstablisher::enumerate() {
    std::map<std::string, AdbDevice> found;

    auto res = adb_({"devices", "-l"});
    if (res.is_err()) {
        ALOG_ERROR("adb", "adb unavailable: %s", res.error().message.c_str());
        notifier_.error("ADB may not be installed or configured correctly",
                        "How to configure ADB", ADB_HELP_URL);
        return found;
    }

    std::istringstream iss(res.value().out);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto parsed = parseDeviceLine(line);
        if (!parsed) continue;
        AdbDevice dev = std::move(*parsed);

        auto brand = adb_({"-s", dev.id, "shell", "getprop", "ro.product.brand"});
        std::string brand_text = brand.is_ok() ? trim(brand.value().out) : std::string();
        if (!brand_text.empty()) dev.brand = brand_text;
        dev.name = dev.brand + " " + dev.model + " (" + dev.id + ")";

        ALOG_DEBUG("adb", "Found %s", dev.name.c_str());
        found[dev.name] = std::move(dev);
    }

    ALOG_INFO("adb", "%zu device(s) ready", found.size());
    return found;
}

// =============================================================================
// Connect
// =============================================================================

Result<int> AdbConnectionEstablisher::leasePort() {
    return sessions_.ports().lease();
}

VoidResult AdbConnectionEstablisher::forward(const std::string& id, int local_port, int device_port) {
    ALOG_DEBUG("adb", "forward %s tcp:%d -> tcp:%d", id.c_str(), local_port, device_port);
    auto res = adb_({"-s", id, "forward",
                     "tcp:" + std::to_string(local_port),
                     "tcp:" + std::to_string(device_port)});
    if (res.is_err()) {
        return Err<void>(ErrorCode::ForwardSetupFailed, res.error().message);
    }
    const ProcessOutput& out = res.value();
    if (out.exit_code != 0 || out.timed_out) {
        std::string raw = trim(out.combined());
        if (raw.empty()) raw = "adb forward exited with code " + std::to_string(out.exit_code);
        return Err<void>(ErrorCode::ForwardSetupFailed, raw);
    }
    return Ok();
}

VoidResult AdbConnectionEstablisher::connect(const AdbDevice& device, ConnectCallback on_done) {
    ALOG_INFO("adb", "Connecting to %s over adb", device.id.c_str());

    // Sequential on purpose: the second lease must see the first one.
    auto client_port = leasePort();
    if (client_port.is_err()) {
        notifier_.error(client_port.error().message);
        return Err<void>(client_port.error());
    }
    auto server_port = leasePort();
    if (server_port.is_err()) {
        notifier_.error(server_port.error().message);
        return Err<void>(server_port.error());
    }

    const std::pair<int, int> forwards[] = {
        {client_port.value(), settings_.device_client_port},
        {server_port.value(), settings_.device_adb_server_port},
    };
    for (const auto& [src, dst] : forwards) {
        auto r = forward(device.id, src, dst);
        if (r.is_err()) {
            ALOG_ERROR("adb", "forward failed for %s: %s", device.id.c_str(), r.error().message.c_str());
            notifier_.error(r.error().message);
            return r;
        }
    }

    TaskScheduler& sched = sessions_.scheduler();
    AdbDevice dev = device;
    std::shared_ptr<Liveness> liveness = liveness_;
    auto timer = sched.schedule(std::chrono::milliseconds(settings_.handshake_timeout_ms),
                                [this, liveness, dev]() {
        std::lock_guard<std::mutex> lock(liveness->mutex);
        if (!liveness->alive) return;
        ALOG_WARN("adb", "No handshake from %s after %d ms, querying provider",
                  dev.id.c_str(), settings_.handshake_timeout_ms);
        diagnose(dev);
    });

    ConnectRequest req;
    req.host = LOOPBACK;
    req.port = client_port.value();
    req.type = SessionType::ServerOverAdb;
    req.adb_device_id = device.id;

    // May run after this object is gone; only the scheduler is touched.
    registry_.connectTo(req, [&sched, timer, on_done, id = device.id](const Result<DeviceSession>& r) {
        if (r.is_ok()) {
            sched.cancel(timer);
            ALOG_INFO("adb", "Session with %s established", id.c_str());
        } else {
            // The handshake timer stays armed and will explain the failure.
            ALOG_WARN("adb", "Connect over adb to %s failed: %s", id.c_str(), r.error().message.c_str());
        }
        if (on_done) on_done(r);
    });
    return Ok();
}

// =============================================================================
// Diagnostic
// =============================================================================

DiagnosticVerdict AdbConnectionEstablisher::diagnose(const AdbDevice& device) {
    auto res = adb_({"-s", device.id, "shell", "content", "query",
                     "--uri", settings_.debug_provider_uri});
    if (res.is_err()) {
        ALOG_ERROR("adb", "Provider query failed: %s", res.error().message.c_str());
        notifier_.error("ADB may not be installed or configured correctly",
                        "How to configure ADB", ADB_HELP_URL);
        return DiagnosticVerdict::QueryFailed;
    }

    const ProcessOutput& out = res.value();
    ALOG_DEBUG("adb", "Provider query: stdout=%s stderr=%s", out.out.c_str(), out.err.c_str());

    if (out.combined().find(PROVIDER_MISSING_MARKER) != std::string::npos) {
        notifier_.warn(SERVER_MODE_HINT);
        return DiagnosticVerdict::ProviderMissing;
    }

    static const std::regex state_re(R"(state=(\d+))");
    std::smatch m;
    if (!std::regex_search(out.out, m, state_re) || m[1].length() > 9 ||
        std::stoi(m[1].str()) != SERVER_READY_STATE) {
        notifier_.error(SERVER_MODE_HINT);
        return DiagnosticVerdict::ServerNotReady;
    }
    return DiagnosticVerdict::Ready;
}

} // namespace autolink
