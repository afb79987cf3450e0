#pragma once

#include <string>

namespace platform {

// Detaches from the terminal. stderr goes to log_path when given, otherwise
// to /dev/null like stdin and stdout.
void daemonize(const std::string& log_path);

} // namespace platform
