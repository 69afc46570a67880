#include "dirtree/app.hpp"

#include "dirtree/cli.hpp"
#include "dirtree/exclusions.hpp"
#include "dirtree/logger.hpp"
#include "dirtree/platform.hpp"
#include "dirtree/prompt.hpp"
#include "dirtree/renderer.hpp"
#include "dirtree/theme.hpp"
#include "dirtree/tree_builder.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace dirtree {

namespace {
constexpr const char* kDefaultConfigName = "exclusions.json";
}

App::App(std::istream& in, std::ostream& out)
    : in_{in}
    , out_{out} {}

int App::run(int argc, char** argv) {
    platform::enable_virtual_terminal_processing();

    const auto program = argc > 0 && argv[0] ? std::string_view{argv[0]} : std::string_view{};
    Cli cli(platform::executable_directory(program) / kDefaultConfigName);
    Options options;
    const int parse_code = cli.parse(argc, argv, options);
    if (parse_code != 0 || cli.exit_requested()) {
        return parse_code;
    }

    auto& logger = Logger::instance();
    logger.set_level(options.log_level);

    const ExclusionConfig exclusions = load_exclusions(options.config_path);

    DirectoryPrompt prompt(in_, out_);
    std::optional<std::filesystem::path> root = options.directory;
    if (root && !is_valid_directory(*root)) {
        logger.debug("rejected directory argument {}", root->string());
        prompt.report_invalid();
        root.reset();
    }
    if (!root) {
        root = prompt.ask();
        if (!root) {
            return 1;
        }
    }

    logger.info("scanning {}", root->string());
    const TreeBuilder builder(exclusions);
    const TreeNode tree = builder.build(*root);

    const bool color = platform::stdout_is_tty() && !platform::color_disabled_by_environment();
    const Theme theme(color);
    Renderer renderer(theme, out_);
    renderer.render(tree);
    return 0;
}

} // namespace dirtree
