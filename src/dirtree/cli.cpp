#include "dirtree/cli.hpp"

#include "dirtree/version.hpp"

#include <functional>
#include <iostream>
#include <map>

namespace dirtree {

namespace {
struct CliState {
    std::string config;
    std::string directory;
    std::string log_level{"warn"};
};
} // namespace

Cli::Cli(std::filesystem::path default_config)
    : default_config_(std::move(default_config)) {}

Cli::~Cli() = default;

Logger::Level Cli::parse_log_level(const std::string& value) {
    static const std::map<std::string, Logger::Level, std::less<>> table{
        {"error", Logger::Level::Error},
        {"warn", Logger::Level::Warning},
        {"warning", Logger::Level::Warning},
        {"info", Logger::Level::Info},
        {"debug", Logger::Level::Debug},
        {"trace", Logger::Level::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        throw CLI::ValidationError("--log-level", "invalid log level: " + value);
    }
    return it->second;
}

int Cli::parse(int argc, char** argv, Options& options) {
    CliState state{};
    state.config = default_config_.string();
    exit_requested_ = false;

    app_ = std::make_unique<CLI::App>("Recursively list project directories while respecting exclusions.");

    auto* version_flag = app_->add_flag("-V,--version", "Print version information and exit");
    app_->add_option("--config", state.config, "Path to the exclusions.json file")
        ->type_name("PATH")
        ->capture_default_str();
    app_->add_option("directory", state.directory,
        "Directory to scan; prompts for one when omitted")
        ->type_name("DIR");
    app_->add_option("-v,--log-level", state.log_level,
        "Set log verbosity (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->default_str("warn");

    try {
        app_->parse(argc, argv);
        options.log_level = parse_log_level(state.log_level);
    } catch (const CLI::ParseError& e) {
        exit_requested_ = true;
        return app_->exit(e);
    }

    if (*version_flag) {
        std::cout << "dirtree version " << Version::String() << std::endl;
        exit_requested_ = true;
        return 0;
    }

    options.config_path = state.config;
    if (!state.directory.empty()) {
        options.directory = std::filesystem::path{state.directory};
    } else {
        options.directory.reset();
    }
    return 0;
}

} // namespace dirtree
