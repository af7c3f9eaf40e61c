#pragma once
// =============================================================================
// AutoLink - ADB Connection Establisher
// =============================================================================
// Connects to the AutoJs6 server on a USB/WiFi adb device:
//
//   lease port A, lease port B (sequentially)
//   adb -s <id> forward tcp:A tcp:<client port>
//   adb -s <id> forward tcp:B tcp:<adb server port>
//   registry.connectTo(127.0.0.1, A, ServerOverAdb, id)
//
// A handshake timer runs beside the connect. If it fires first, the device's
// debug provider is queried so the user learns why nothing happened. The
// timer never aborts the connect, and a successful connect cancels it.
// =============================================================================

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "device_registry.hpp"
#include "process_runner.hpp"
#include "result.hpp"
#include "session_manager.hpp"
#include "ui.hpp"

namespace autolink {

struct AdbDevice {
    std::string id;
    std::string brand = "Unknown";
    std::string model = "Unknown";
    std::string name = "NoName";
    std::map<std::string, std::string> properties;  // everything from `devices -l`

    std::string property(const std::string& key) const {
        auto it = properties.find(key);
        return it == properties.end() ? std::string() : it->second;
    }
};

// Runs adb with the given arguments (the adb path is the executor's concern).
using AdbExecutor = std::function<Result<ProcessOutput>(const std::vector<std::string>& args)>;

// adb at `adb_path`, each call bounded by timeout_ms
AdbExecutor makeAdbExecutor(const std::string& adb_path, int timeout_ms);

enum class DiagnosticVerdict {
    Ready,           // state=2, nothing to report
    ProviderMissing, // "Could not find provider"
    ServerNotReady,  // no state, or state != 2
    QueryFailed,     // adb itself could not run
};

struct AdbSettings {
    int device_client_port = 7347;
    int device_adb_server_port = 6347;
    int handshake_timeout_ms = 5000;
    std::string debug_provider_uri = "content://org.autojs.autojs.debug.provider/debug-server";
};

class AdbConnectionEstablisher {
public:
    static constexpr const char* ADB_HELP_URL = "https://segmentfault.com/a/1190000021822394";
    static constexpr const char* SERVER_MODE_HINT =
        "Make sure \"Server mode\" is enabled in the AutoJs6 side drawer";
    static constexpr int SERVER_READY_STATE = 2;

    using ConnectCallback = std::function<void(const Result<DeviceSession>&)>;

    AdbConnectionEstablisher(SessionManager& sessions, DeviceRegistry& registry,
                             Notifier& notifier, AdbExecutor adb, AdbSettings settings = {});
    // Waits for a running diagnostic; later timers and connect callbacks
    // become no-ops for this object.
    ~AdbConnectionEstablisher();

    AdbConnectionEstablisher(const AdbConnectionEstablisher&) = delete;
    AdbConnectionEstablisher& operator=(const AdbConnectionEstablisher&) = delete;

    // display name -> device. Empty (with a notice) when adb cannot run.
    std::map<std::string, AdbDevice> enumerate();

    // Returns once the forwards are in place; the session itself arrives
    // through on_done and the registry's attach event.
    VoidResult connect(const AdbDevice& device, ConnectCallback on_done = nullptr);

    // The handshake-timeout query; notifies the user unless the server is ready.
    DiagnosticVerdict diagnose(const AdbDevice& device);

    // "<id> device usb:.. product:.. model:.. ..." -> device without brand/name
    static std::optional<AdbDevice> parseDeviceLine(const std::string& line);

private:
    Result<int> leasePort();
    VoidResult forward(const std::string& id, int local_port, int device_port);

    // Shared with timer tasks and registry callbacks that may outlive us
    struct Liveness {
        std::mutex mutex;
        bool alive = true;
    };

    SessionManager& sessions_;
    DeviceRegistry& registry_;
    Notifier& notifier_;
    AdbExecutor adb_;
    AdbSettings settings_;
    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
};

} // namespace autolink
