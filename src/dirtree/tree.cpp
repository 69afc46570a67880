#include "dirtree/tree.hpp"

namespace dirtree {

TreeNode TreeNode::root(const std::filesystem::path& path) {
    TreeNode node;
    node.label = path.string();
    node.kind = Kind::Root;
    node.path = path;
    return node;
}

TreeNode& TreeNode::add_child(TreeNode child) {
    children.push_back(std::move(child));
    return children.back();
}

bool operator==(const TreeNode& lhs, const TreeNode& rhs) {
    return lhs.kind == rhs.kind
        && lhs.label == rhs.label
        && lhs.path == rhs.path
        && lhs.error == rhs.error
        && lhs.children == rhs.children;
}

} // namespace dirtree
