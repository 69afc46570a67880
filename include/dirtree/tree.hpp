#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace dirtree {

struct TreeNode {
    enum class Kind {
        Root,
        Directory,
        File,
        PermissionError
    };

    std::string label;
    Kind kind = Kind::Root;
    std::filesystem::path path;
    // Set on PermissionError nodes only.
    std::error_code error;
    std::vector<TreeNode> children;

    [[nodiscard]] static TreeNode root(const std::filesystem::path& path);

    TreeNode& add_child(TreeNode child);
};

[[nodiscard]] bool operator==(const TreeNode& lhs, const TreeNode& rhs);

} // namespace dirtree
