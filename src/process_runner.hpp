#pragma once
// =============================================================================
// AutoLink - Process Runner
// =============================================================================
// Runs an external tool (adb) with an argv vector, no shell involved.
// stdout and stderr are captured separately; the child is killed when the
// timeout expires.
// =============================================================================

#include <string>
#include <vector>
#include "result.hpp"

namespace autolink {

struct ProcessOutput {
    std::string out;
    std::string err;
    int exit_code = -1;
    bool timed_out = false;

    std::string combined() const { return out + err; }
};

// Returns BridgeToolUnavailable when the executable could not be started.
// A non-zero exit is not an error here: callers inspect exit_code.
Result<ProcessOutput> runProcess(const std::vector<std::string>& argv, int timeout_ms = 8000);

} // namespace autolink
