#pragma once
#include <string>

namespace procutil {

// Runs a shell command line and returns captured stdout.
// exit_code receives the child's exit status (-1 when it could not be started).
// Returns "" on failure.
std::string run_capture_stdout(const std::string& cmdline, int* exit_code = nullptr);

// Single-quotes s for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace procutil
