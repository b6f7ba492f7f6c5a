#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII lowercase copy.
std::string to_lower(const std::string& s);

// First max_chars bytes of a line for log output, with "..." when cut.
std::string preview(const std::string& s, size_t max_chars);

// True when the string is empty or only whitespace.
bool is_blank(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Trimmed copy.
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
