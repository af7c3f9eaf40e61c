#pragma once
// =============================================================================
// AutoLink - UI collaborator interfaces
// =============================================================================
// The connection flows only talk to the user through these two interfaces.
// The CLI plugs in console implementations; tests plug in recorders.
// =============================================================================

#include <optional>
#include <string>
#include <vector>

namespace autolink {

class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    // help_url is offered to the user next to the error when not empty
    virtual void error(const std::string& message,
                       const std::string& help_label = {},
                       const std::string& help_url = {}) = 0;
    // Multi-line diagnostic under a header
    virtual void detail(const std::string& header, const std::vector<std::string>& lines) = 0;
};

struct PickItem {
    std::string label;
    std::string detail;
};

struct PickRequest {
    std::string title;
    std::string placeholder;
    std::vector<PickItem> items;
    bool allow_free_text = false;
};

struct PickResult {
    std::string label;       // chosen item label, or the free text itself
    std::string typed_text;  // what the user typed before choosing
};

class Prompter {
public:
    virtual ~Prompter() = default;

    // nullopt = dismissed
    virtual std::optional<PickResult> pick(const PickRequest& request) = 0;
    virtual bool confirm(const std::string& title) = 0;
};

} // namespace autolink
