#pragma once
// =============================================================================
// AutoLink - Command Dispatcher
// =============================================================================
// Maps command names received on /exec to handlers. Only names in the closed
// CommandTag set are accepted; anything else is reported and dropped.
//
// rerunProject is handled here: stopAll now, run(params) after a delay so the
// previous run has time to finish.
// =============================================================================

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "event_bus.hpp"
#include "result.hpp"
#include "task_scheduler.hpp"
#include "ui.hpp"

namespace autolink {

enum class CommandTag {
    ViewDocument,
    Connect,
    DisconnectAll,
    Run,
    RunWithoutArguments,
    RunOnDevice,
    Stop,
    StopAll,
    Rerun,
    Save,
    SaveToDevice,
    NewUntitledFile,
    NewProject,
    RunProject,
    SaveProject,
    CommandsHierarchy,
    RerunProject,
};

const char* commandTagName(CommandTag tag);
std::optional<CommandTag> parseCommandTag(const std::string& name);
const std::vector<CommandTag>& allCommandTags();

class CommandDispatcher {
public:
    using Params = std::vector<std::string>;
    using Handler = std::function<void(const Params&)>;

    CommandDispatcher(TaskScheduler& scheduler, Notifier& notifier, int rerun_delay_ms = 1000);

    void registerHandler(CommandTag tag, Handler handler);
    bool hasHandler(CommandTag tag) const;

    // Errors: UnknownCommand for names outside the allow-list, Unknown when
    // the command exists but nothing handles it here.
    VoidResult dispatch(const std::string& name, const Params& params = {});

    // Feeds ExecRequestEvent from the ingest server into dispatch().
    SubscriptionHandle attach(EventBus& bus);

private:
    void invoke(CommandTag tag, const Params& params);

    TaskScheduler& scheduler_;
    Notifier& notifier_;
    int rerun_delay_ms_;
    std::map<CommandTag, Handler> handlers_;
};

} // namespace autolink
