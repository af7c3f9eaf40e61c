// =============================================================================
// AutoLink - Script Actions
// =============================================================================
#include "script_actions.hpp"
#include "autolink_log.hpp"
#include "command_dispatcher.hpp"

#include <fstream>
#include <sstream>

#include <unistd.h>

namespace autolink {

namespace {

std::string firstParam(const CommandDispatcher::Params& p) {
    return p.empty() ? std::string() : p.front();
}

// Actions report their own failures to the user; the dispatcher only logs.
void logResult(const char* action, const VoidResult& r) {
    if (r.is_err()) {
        ALOG_DEBUG("actions", "%s: %s (%s)", action, r.error().message.c_str(),
                   errorCodeName(r.error().code));
    }
}

std::string currentDirectory() {
    char buf[4096];
    if (::getcwd(buf, sizeof(buf)) == nullptr) return ".";
    return buf;
}

} // namespace

ScriptActions::ScriptActions(DeviceRegistry& registry, Notifier& notifier, Prompter& prompter)
    : registry_(registry), notifier_(notifier), prompter_(prompter) {}

Result<nlohmann::json> ScriptActions::scriptPayload(const std::string& path) {
    if (path.empty()) {
        return Err<nlohmann::json>(ErrorCode::Io, "A script path is required (no open editor in this host)");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<nlohmann::json>(ErrorCode::Io, "Cannot read " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Ok(nlohmann::json{{"id", path}, {"name", path}, {"script", ss.str()}});
}

std::vector<DeviceSession> ScriptActions::selectDevice() {
    auto devices = registry_.devices();
    if (devices.empty()) {
        notifier_.error(NO_DEVICE_MESSAGE);
        return {};
    }

    PickRequest req;
    req.title = "Select a device";
    for (const auto& d : devices) {
        std::string label = d.display_name.empty() ? d.device_id : d.display_name;
        req.items.push_back(PickItem{label, sessionTypeName(d.type)});
    }
    auto choice = prompter_.pick(req);
    if (!choice) return {};

    for (size_t i = 0; i < devices.size(); ++i) {
        if (req.items[i].label == choice->label) return {devices[i]};
    }
    return {};
}

VoidResult ScriptActions::sendScript(const std::string& command, const std::string& path,
                                     const std::vector<DeviceSession>* only) {
    if (!only && !registry_.hasDevices()) {
        notifier_.error(NO_DEVICE_MESSAGE);
        return Err<void>(ErrorCode::NoDeviceConnected, NO_DEVICE_MESSAGE);
    }

    auto payload = scriptPayload(path);
    if (payload.is_err()) {
        notifier_.error(payload.error().message);
        return Err<void>(payload.error());
    }

    if (!only) {
        size_t n = registry_.sendCommand(command, payload.value());
        ALOG_INFO("actions", "%s %s -> %zu device(s)", command.c_str(), path.c_str(), n);
        return Ok();
    }
    for (const auto& d : *only) {
        auto r = registry_.sendCommandTo(d.device_id, command, payload.value());
        if (r.is_err()) {
            notifier_.error(r.error().message);
            return r;
        }
    }
    return Ok();
}

VoidResult ScriptActions::run(const std::string& path) {
    return sendScript("run", path, nullptr);
}

VoidResult ScriptActions::runOnDevice(const std::string& path) {
    auto selected = selectDevice();
    if (selected.empty()) return Err<void>(ErrorCode::NoDeviceConnected, "no device selected");
    return sendScript("run", path, &selected);
}

VoidResult ScriptActions::stop(const std::string& path) {
    nlohmann::json payload = {{"id", path.empty() ? nlohmann::json() : nlohmann::json(path)}};
    registry_.sendCommand("stop", payload);
    return Ok();
}

VoidResult ScriptActions::stopAll() {
    size_t n = registry_.sendCommand("stopAll");
    ALOG_INFO("actions", "stopAll -> %zu device(s)", n);
    return Ok();
}

VoidResult ScriptActions::rerun(const std::string& path) {
    auto stopped = stop(path);
    if (stopped.is_err()) return stopped;
    return run(path);
}

VoidResult ScriptActions::save(const std::string& path) {
    return sendScript("save", path, nullptr);
}

VoidResult ScriptActions::saveToDevice(const std::string& path) {
    auto selected = selectDevice();
    if (selected.empty()) return Err<void>(ErrorCode::NoDeviceConnected, "no device selected");
    return sendScript("save", path, &selected);
}

VoidResult ScriptActions::sendProject(const std::string& command, const std::string& folder) {
    std::string dir = folder.empty() ? currentDirectory() : folder;
    size_t n = registry_.sendCommand(command, {{"id", dir}, {"folder", dir}});
    if (n == 0) {
        notifier_.error(NO_DEVICE_MESSAGE);
        return Err<void>(ErrorCode::NoDeviceConnected, NO_DEVICE_MESSAGE);
    }
    ALOG_INFO("actions", "%s %s -> %zu device(s)", command.c_str(), dir.c_str(), n);
    return Ok();
}

VoidResult ScriptActions::runProject(const std::string& folder) {
    return sendProject("run_project", folder);
}

VoidResult ScriptActions::saveProject(const std::string& folder) {
    return sendProject("save_project", folder);
}

void ScriptActions::disconnectAll() {
    registry_.disconnect();
    notifier_.info("All AutoJs6 connections disconnected");
}

void ScriptActions::viewDocument() {
    notifier_.info(std::string("Documentation: ") + DOCS_URL);
}

void ScriptActions::commandsHierarchy() {
    notifier_.info("The commands hierarchy will be available in a later version");
}

void ScriptActions::registerWith(CommandDispatcher& d) {
    using P = CommandDispatcher::Params;
    d.registerHandler(CommandTag::ViewDocument, [this](const P&) { viewDocument(); });
    d.registerHandler(CommandTag::DisconnectAll, [this](const P&) { disconnectAll(); });
    d.registerHandler(CommandTag::Run, [this](const P& p) { logResult("run", run(firstParam(p))); });
    d.registerHandler(CommandTag::RunWithoutArguments, [this](const P&) { logResult("run", run()); });
    d.registerHandler(CommandTag::RunOnDevice, [this](const P& p) {
        logResult("runOnDevice", runOnDevice(firstParam(p)));
    });
    d.registerHandler(CommandTag::Stop, [this](const P& p) { logResult("stop", stop(firstParam(p))); });
    d.registerHandler(CommandTag::StopAll, [this](const P&) { logResult("stopAll", stopAll()); });
    d.registerHandler(CommandTag::Rerun, [this](const P& p) { logResult("rerun", rerun(firstParam(p))); });
    d.registerHandler(CommandTag::Save, [this](const P& p) { logResult("save", save(firstParam(p))); });
    d.registerHandler(CommandTag::SaveToDevice, [this](const P& p) {
        logResult("saveToDevice", saveToDevice(firstParam(p)));
    });
    d.registerHandler(CommandTag::RunProject, [this](const P& p) {
        logResult("runProject", runProject(firstParam(p)));
    });
    d.registerHandler(CommandTag::SaveProject, [this](const P& p) {
        logResult("saveProject", saveProject(firstParam(p)));
    });
    d.registerHandler(CommandTag::CommandsHierarchy, [this](const P&) { commandsHierarchy(); });
}

} // namespace autolink
