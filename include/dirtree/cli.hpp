#pragma once

#include "dirtree/options.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace dirtree {

class Cli {
public:
    explicit Cli(std::filesystem::path default_config);
    ~Cli();

    /// Fills `options` from the command line. A non-zero result, or
    /// `exit_requested()` after --help/--version, means the program should
    /// stop with that code.
    int parse(int argc, char** argv, Options& options);

    [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }

    [[nodiscard]] static Logger::Level parse_log_level(const std::string& value);

private:
    std::unique_ptr<CLI::App> app_;
    std::filesystem::path default_config_;
    bool exit_requested_{false};
};

} // namespace dirtree
