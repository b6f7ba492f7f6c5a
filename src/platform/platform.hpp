#pragma once

#include <string>
#include <map>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Get terminal dimensions of stdout; 80x24 when stdout is not a terminal.
int term_width();
int term_height();

// Snapshot of the process environment.
std::map<std::string, std::string> environment();

// Name of the parent process (the program driving our stdin), or "" if unknown.
std::string parent_process_name();

} // namespace platform
