#pragma once

#include "dirtree/logger.hpp"

#include <filesystem>
#include <optional>

namespace dirtree {

struct Options {
    std::filesystem::path config_path{};
    std::optional<std::filesystem::path> directory{};
    Logger::Level log_level{Logger::Level::Warning};
};

} // namespace dirtree
