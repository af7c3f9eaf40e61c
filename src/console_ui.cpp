#include "console_ui.hpp"
#include "autolink_log.hpp"

#include <string>

namespace autolink {

void ConsoleNotifier::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[info] " << message << std::endl;
    ALOG_INFO("ui", "%s", message.c_str());
}

void ConsoleNotifier::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[warn] " << message << std::endl;
    ALOG_WARN("ui", "%s", message.c_str());
}

void ConsoleNotifier::error(const std::string& message,
                            const std::string& help_label,
                            const std::string& help_url) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[error] " << message << std::endl;
    if (!help_url.empty()) {
        out_ << "        " << (help_label.empty() ? "Help" : help_label) << ": " << help_url << std::endl;
    }
    ALOG_ERROR("ui", "%s", message.c_str());
}

void ConsoleNotifier::detail(const std::string& header, const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << header << std::endl;
    for (const auto& line : lines) {
        out_ << "  - " << line << std::endl;
    }
}

std::optional<PickResult> ConsolePrompter::pick(const PickRequest& request) {
    if (!request.title.empty()) out_ << request.title << std::endl;
    for (size_t i = 0; i < request.items.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << request.items[i].label << std::endl;
        if (!request.items[i].detail.empty()) {
            out_ << "     " << request.items[i].detail << std::endl;
        }
    }
    out_ << (request.placeholder.empty() ? "Choose" : request.placeholder) << " > " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    size_t b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::nullopt;
    line = line.substr(b, line.find_last_not_of(" \t\r") - b + 1);

    bool numeric = line.find_first_not_of("0123456789") == std::string::npos;
    if (numeric) {
        unsigned long idx = 0;
        try {
            idx = std::stoul(line);
        } catch (const std::out_of_range&) {
            idx = 0;
        }
        if (idx >= 1 && idx <= request.items.size()) {
            return PickResult{request.items[idx - 1].label, {}};
        }
    }

    if (request.allow_free_text) {
        // Filtering pick: the first item containing the text is chosen and
        // the text is passed along for the ambiguity check.
        for (const auto& item : request.items) {
            if (item.label.find(line) != std::string::npos) {
                return PickResult{item.label, line};
            }
        }
        return PickResult{line, line};
    }
    out_ << "Invalid choice" << std::endl;
    return std::nullopt;
}

bool ConsolePrompter::confirm(const std::string& title) {
    out_ << title << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) return false;
    return !line.empty() && (line[0] == 'y' || line[0] == 'Y');
}

} // namespace autolink
