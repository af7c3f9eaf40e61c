#pragma once
// =============================================================================
// AutoLink - Console UI
// =============================================================================
// stdin/stdout implementations of Notifier and Prompter for the CLI.
// =============================================================================

#include <iostream>
#include <mutex>
#include "ui.hpp"

namespace autolink {

class ConsoleNotifier : public Notifier {
public:
    explicit ConsoleNotifier(std::ostream& out = std::cout) : out_(out) {}

    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message,
               const std::string& help_label = {},
               const std::string& help_url = {}) override;
    void detail(const std::string& header, const std::vector<std::string>& lines) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    // Items are numbered from 1. A number picks the item; with
    // allow_free_text any other non-empty input is returned as typed text.
    std::optional<PickResult> pick(const PickRequest& request) override;
    bool confirm(const std::string& title) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace autolink
