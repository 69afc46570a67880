#include "dirtree/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace dirtree::platform {

bool stdout_is_tty() {
#ifdef _WIN32
    return ::_isatty(_fileno(stdout)) != 0;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

bool color_disabled_by_environment() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && *value != '\0';
}

void enable_virtual_terminal_processing() {
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return;
    }
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
    ::SetConsoleOutputCP(CP_UTF8);
#endif
}

std::filesystem::path executable_directory(std::string_view argv0) {
    std::error_code ec;
#ifdef _WIN32
    wchar_t buffer[MAX_PATH];
    const DWORD length = ::GetModuleFileNameW(nullptr, buffer, MAX_PATH);
    if (length > 0 && length < MAX_PATH) {
        return std::filesystem::path(buffer, buffer + length).parent_path();
    }
#else
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }
#endif
    if (!argv0.empty()) {
        auto absolute = std::filesystem::absolute(std::filesystem::path{argv0}, ec);
        if (!ec) {
            return absolute.parent_path();
        }
    }
    return std::filesystem::current_path(ec);
}

} // namespace dirtree::platform
