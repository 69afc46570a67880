#include "dirtree/prompt.hpp"

#include "dirtree/logger.hpp"

#include <string>
#include <system_error>

namespace dirtree {
namespace {

std::string trim(const std::string& text) {
    constexpr const char* kWhitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

bool is_valid_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec) && !ec;
}

DirectoryPrompt::DirectoryPrompt(std::istream& in, std::ostream& out)
    : in_{in}
    , out_{out} {}

std::optional<std::filesystem::path> DirectoryPrompt::ask() const {
    std::string line;
    while (true) {
        out_ << "\U0001F539 Enter the directory to scan (or press Enter to use the current directory): " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << '\n';
            Logger::instance().debug("input closed before a directory was chosen");
            return std::nullopt;
        }

        const std::string input = trim(line);
        if (input.empty()) {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (ec) {
                Logger::instance().error("cannot determine current directory: {}", ec.message());
                continue;
            }
            out_ << "\u2705 Using current directory: " << cwd.string() << '\n';
            return cwd;
        }

        std::filesystem::path candidate{input};
        if (is_valid_directory(candidate)) {
            return candidate;
        }
        report_invalid();
    }
}

void DirectoryPrompt::report_invalid() const {
    out_ << "\u274C Invalid directory. Please enter a valid path.\n";
}

} // namespace dirtree
