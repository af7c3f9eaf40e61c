#include "command_dispatcher.hpp"
#include "autolink_log.hpp"

namespace autolink {

namespace {

struct TagName {
    CommandTag tag;
    const char* name;
};

constexpr TagName TAG_NAMES[] = {
    {CommandTag::ViewDocument,        "viewDocument"},
    {CommandTag::Connect,             "connect"},
    {CommandTag::DisconnectAll,       "disconnectAll"},
    {CommandTag::Run,                 "run"},
    {CommandTag::RunWithoutArguments, "runWithoutArguments"},
    {CommandTag::RunOnDevice,         "runOnDevice"},
    {CommandTag::Stop,                "stop"},
    {CommandTag::StopAll,             "stopAll"},
    {CommandTag::Rerun,               "rerun"},
    {CommandTag::Save,                "save"},
    {CommandTag::SaveToDevice,        "saveToDevice"},
    {CommandTag::NewUntitledFile,     "newUntitledFile"},
    {CommandTag::NewProject,          "newProject"},
    {CommandTag::RunProject,          "runProject"},
    {CommandTag::SaveProject,         "saveProject"},
    {CommandTag::CommandsHierarchy,   "commandsHierarchy"},
    {CommandTag::RerunProject,        "rerunProject"},
};

} // namespace

const char* commandTagName(CommandTag tag) {
    for (const auto& t : TAG_NAMES) {
        if (t.tag == tag) return t.name;
    }
    return "?";
}

std::optional<CommandTag> parseCommandTag(const std::string& name) {
    for (const auto& t : TAG_NAMES) {
        if (name == t.name) return t.tag;
    }
    return std::nullopt;
}

const std::vector<CommandTag>& allCommandTags() {
    static const std::vector<CommandTag> tags = [] {
        std::vector<CommandTag> v;
        for (const auto& t : TAG_NAMES) v.push_back(t.tag);
        return v;
    }();
    return tags;
}

CommandDispatcher::CommandDispatcher(TaskScheduler& scheduler, Notifier& notifier, int rerun_delay_ms)
    : scheduler_(scheduler), notifier_(notifier), rerun_delay_ms_(rerun_delay_ms) {}

void CommandDispatcher::registerHandler(CommandTag tag, Handler handler) {
    handlers_[tag] = std::move(handler);
}

bool CommandDispatcher::hasHandler(CommandTag tag) const {
    return handlers_.count(tag) > 0;
}

void CommandDispatcher::invoke(CommandTag tag, const Params& params) {
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) {
        notifier_.warn(std::string("Command \"") + commandTagName(tag) + "\" is not available in this host");
        return;
    }
    it->second(params);
}

VoidResult CommandDispatcher::dispatch(const std::string& name, const Params& params) {
    ALOG_DEBUG("dispatch", "Received cmd: %s", name.c_str());

    auto tag = parseCommandTag(name);
    if (!tag) {
        notifier_.error("Unknown command received: \"" + name + "\"");
        return Err<void>(ErrorCode::UnknownCommand, "unknown command: " + name);
    }

    if (*tag == CommandTag::RerunProject) {
        invoke(CommandTag::StopAll, {});
        scheduler_.schedule(std::chrono::milliseconds(rerun_delay_ms_), [this, params]() {
            invoke(CommandTag::Run, params);
        });
        return Ok();
    }

    if (!hasHandler(*tag)) {
        invoke(*tag, params);
        return Err<void>(ErrorCode::Unknown, std::string(commandTagName(*tag)) + " not available");
    }

    ALOG_INFO("dispatch", "Executing \"%s\"", name.c_str());
    invoke(*tag, params);
    return Ok();
}

SubscriptionHandle CommandDispatcher::attach(EventBus& bus) {
    return bus.subscribe<ExecRequestEvent>([this](const ExecRequestEvent& e) {
        Params params;
        if (!e.path.empty()) params.push_back(e.path);
        auto r = dispatch(e.cmd, params);
        if (r.is_err()) {
            ALOG_DEBUG("dispatch", "%s: %s", errorCodeName(r.error().code), r.error().message.c_str());
        }
    });
}

} // namespace autolink
