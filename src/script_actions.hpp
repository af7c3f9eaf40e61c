#pragma once
// =============================================================================
// AutoLink - Script Actions
// =============================================================================
// Editor actions that send script commands to connected devices.
// There is no editor buffer in this host: scripts are read from the path
// passed with the command.
//
//   run / save          -> "run" / "save" {id, name, script}
//   stop                -> "stop" {id}
//   stopAll             -> "stopAll"
//   runProject / saveProject -> "run_project" / "save_project" {id, folder}
// =============================================================================

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "device_registry.hpp"
#include "result.hpp"
#include "ui.hpp"

namespace autolink {

class CommandDispatcher;

class ScriptActions {
public:
    static constexpr const char* DOCS_URL = "https://docs.autojs6.com/";
    static constexpr const char* NO_DEVICE_MESSAGE = "No connected device found";

    ScriptActions(DeviceRegistry& registry, Notifier& notifier, Prompter& prompter);

    VoidResult run(const std::string& path = {});
    VoidResult runOnDevice(const std::string& path = {});
    VoidResult stop(const std::string& path = {});
    VoidResult stopAll();
    VoidResult rerun(const std::string& path = {});
    VoidResult save(const std::string& path = {});
    VoidResult saveToDevice(const std::string& path = {});
    VoidResult runProject(const std::string& folder = {});
    VoidResult saveProject(const std::string& folder = {});

    void disconnectAll();
    void viewDocument();
    void commandsHierarchy();

    // Binds every action above to its command tag.
    void registerWith(CommandDispatcher& dispatcher);

private:
    Result<nlohmann::json> scriptPayload(const std::string& path);
    std::vector<DeviceSession> selectDevice();
    VoidResult sendScript(const std::string& command, const std::string& path,
                          const std::vector<DeviceSession>* only);
    VoidResult sendProject(const std::string& command, const std::string& folder);

    DeviceRegistry& registry_;
    Notifier& notifier_;
    Prompter& prompter_;
};

} // namespace autolink
