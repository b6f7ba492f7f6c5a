#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <fstream>
#include <cstring>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <sys/ioctl.h>
#  include <unistd.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path(".");
    return p;
}

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return static_cast<int>(DEFAULT_TERMINAL_WIDTH);
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return static_cast<int>(DEFAULT_TERMINAL_WIDTH);
#endif
}

int term_height() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    return static_cast<int>(DEFAULT_TERMINAL_HEIGHT);
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return static_cast<int>(DEFAULT_TERMINAL_HEIGHT);
#endif
}

// ── Process introspection ────────────────────────────────────

std::map<std::string, std::string> environment() {
    std::map<std::string, std::string> env;
#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (!block) return env;
    for (LPCH p = block; *p; p += std::strlen(p) + 1) {
        std::string entry(p);
        auto eq = entry.find('=', 1);
        if (eq != std::string::npos) env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    FreeEnvironmentStringsA(block);
#else
    for (char** p = environ; p && *p; ++p) {
        std::string entry(*p);
        auto eq = entry.find('=');
        if (eq != std::string::npos) env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
#endif
    return env;
}

std::string parent_process_name() {
#ifdef __linux__
    std::ifstream comm("/proc/" + std::to_string(getppid()) + "/comm");
    std::string name;
    if (comm && std::getline(comm, name)) return name;
#endif
    return "";
}

} // namespace platform
