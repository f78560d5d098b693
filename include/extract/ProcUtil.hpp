#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;     // -1 when the process could not be started
    std::string out;        // captured stdout
};

// Runs a command line through /bin/sh and captures its stdout.
ProcResult run_capture_stdout(const std::string& cmdline);

// Single-quotes `arg` for /bin/sh.
std::string shell_quote(const std::string& arg);

} // namespace procutil
