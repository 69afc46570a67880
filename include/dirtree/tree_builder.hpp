#pragma once

#include "dirtree/exclusions.hpp"
#include "dirtree/tree.hpp"

#include <filesystem>

namespace dirtree {

// Depth-first, read-only walk that turns a directory into a TreeNode tree.
//
// Excluded directories are pruned without being opened. Symbolic links
// and special files are left out. A directory that cannot be listed gets
// a single PermissionError child; the walk carries on with its siblings.
class TreeBuilder {
public:
    explicit TreeBuilder(const ExclusionConfig& exclusions);

    [[nodiscard]] TreeNode build(const std::filesystem::path& root) const;
    TreeNode& build(const std::filesystem::path& root, TreeNode& node) const;

private:
    const ExclusionConfig& exclusions_;

    static void add_error(TreeNode& node, const std::filesystem::path& path, std::error_code ec);
};

} // namespace dirtree
