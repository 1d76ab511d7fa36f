#pragma once

#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir when unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// True when stdin is a terminal rather than a pipe or file.
bool stdin_is_tty();

} // namespace platform
