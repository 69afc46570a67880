#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace dirtree {

// Bare entry names to leave out of a scan. Names are compared exactly
// against the last path component, never as paths or patterns.
struct ExclusionConfig {
    std::set<std::string> excluded_directory_names;
    std::set<std::string> excluded_file_names;

    [[nodiscard]] bool excludes_directory(std::string_view name) const;
    [[nodiscard]] bool excludes_file(std::string_view name) const;
    [[nodiscard]] bool empty() const noexcept;
};

/// Reads `{"exclude_dirs": [...], "exclude_files": [...]}` from `path`.
///
/// A missing, unreadable or malformed document is reported as a warning
/// and yields an empty configuration. Missing keys yield empty sets.
[[nodiscard]] ExclusionConfig load_exclusions(const std::filesystem::path& path);

} // namespace dirtree
