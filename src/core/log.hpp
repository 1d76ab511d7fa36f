#pragma once

#include <string>

// Debug log: timestamped lines appended to <temp_dir>/jpick_debug.log.
// Off until enabled; a log file that cannot be opened drops the line.
void set_log_enabled(bool enabled);

// Redirect the log. An empty path restores the default location.
void set_log_path(const std::string& path);
std::string jpick_log_path();

void jpick_log(const std::string& msg);
