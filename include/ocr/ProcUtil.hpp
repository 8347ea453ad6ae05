#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1 if the process could not be started
    std::string output;   // captured stdout
};

// Runs a command line through /bin/sh and captures stdout.
ProcResult run_capture_stdout(const std::string& cmdline);

// `command -v <name>` succeeds
bool command_exists(const std::string& name);

// wrap in single quotes for /bin/sh, escaping embedded quotes
std::string shell_quote(const std::string& s);

} // namespace procutil
