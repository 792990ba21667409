#pragma once
#include <string>
#include <vector>
#include <optional>
#include "model/ReviewTypes.hpp"

namespace pyguard::sandbox {

// Descriptor the harness writes its JSON-lines records to.
const int HARNESS_CHANNEL_FD = 3;
// Exit status when the harness could not load the fragment (before "ready").
const int HARNESS_BOOTSTRAP_EXIT = 86;
// Exit status after the audit hook rejected an operation.
const int HARNESS_VIOLATION_EXIT = 87;

// Name of the fragment file inside the scratch area.
const char* const FRAGMENT_FILE_NAME = "fragment.py";

// Python bootstrap passed to the interpreter with -c.
// argv: <scratch> <network 0|1> <filesystem 0|1> <entry point or "">
const std::string& harness_source();

std::vector<std::string> harness_arguments(const std::string& scratch,
                                           bool network_allowed,
                                           bool filesystem_allowed,
                                           const std::optional<std::string>& entry_point);

// What the harness reported over the channel.
struct HarnessReport {
    bool ready = false;                      // Audit hook installed, fragment about to run
    std::optional<ExceptionTrace> exception; // Uncaught exception from the fragment
    std::optional<std::string> violation;    // "<audit event>: <detail>"
};

// Malformed lines are skipped; the first record of each kind wins.
HarnessReport parse_channel(const std::string& data);

}
