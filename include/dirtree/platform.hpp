#pragma once

#include <filesystem>
#include <string_view>

namespace dirtree::platform {

[[nodiscard]] bool stdout_is_tty();
[[nodiscard]] bool color_disabled_by_environment();
void enable_virtual_terminal_processing();

// Directory holding the running executable. Falls back to the directory
// part of argv[0], then to the current directory.
[[nodiscard]] std::filesystem::path executable_directory(std::string_view argv0);

} // namespace dirtree::platform
