#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>

namespace dirtree {

[[nodiscard]] bool is_valid_directory(const std::filesystem::path& path);

// Asks for the directory to scan until a usable one is given.
class DirectoryPrompt {
public:
    DirectoryPrompt(std::istream& in, std::ostream& out);

    /// Empty input selects the current directory. Returns std::nullopt
    /// once the input is exhausted.
    [[nodiscard]] std::optional<std::filesystem::path> ask() const;

    void report_invalid() const;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dirtree
