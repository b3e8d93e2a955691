#pragma once

#include <string>

namespace platform {

// Detaches from the terminal. stderr is appended to log_path, or discarded
// when log_path is empty or cannot be opened.
void daemonize(const std::string& log_path);

} // namespace platform
