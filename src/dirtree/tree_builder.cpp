#include "dirtree/tree_builder.hpp"

#include "dirtree/logger.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <vector>

namespace dirtree {
namespace {

struct Listing {
    std::string name;
    std::filesystem::path path;
};

std::vector<Listing> list_directory(const std::filesystem::path& path, std::error_code& ec) {
    std::vector<Listing> entries;
    ec.clear();
    for (std::filesystem::directory_iterator it(path, ec); !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        entries.push_back({it->path().filename().string(), it->path()});
    }
    std::sort(entries.begin(), entries.end(), [](const Listing& a, const Listing& b) {
        return a.name < b.name;
    });
    return entries;
}

TreeNode make_node(TreeNode::Kind kind, const Listing& entry) {
    TreeNode node;
    node.kind = kind;
    node.label = entry.name;
    node.path = entry.path;
    return node;
}

} // namespace

TreeBuilder::TreeBuilder(const ExclusionConfig& exclusions)
    : exclusions_{exclusions} {}

TreeNode TreeBuilder::build(const std::filesystem::path& root) const {
    TreeNode node = TreeNode::root(root);
    build(root, node);
    return node;
}

TreeNode& TreeBuilder::build(const std::filesystem::path& root, TreeNode& node) const {
    std::error_code ec;
    const auto entries = list_directory(root, ec);
    if (ec) {
        add_error(node, root, ec);
        return node;
    }

    for (const auto& entry : entries) {
        // symlink_status keeps links out of both branches below.
        const auto status = std::filesystem::symlink_status(entry.path, ec);
        if (ec) {
            add_error(node, entry.path, ec);
            ec.clear();
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (exclusions_.excludes_directory(entry.name)) {
                Logger::instance().log(Logger::Level::Trace, "pruned {}", entry.path.string());
                continue;
            }
            auto& child = node.add_child(make_node(TreeNode::Kind::Directory, entry));
            build(entry.path, child);
        } else if (std::filesystem::is_regular_file(status)) {
            if (exclusions_.excludes_file(entry.name)) {
                continue;
            }
            node.add_child(make_node(TreeNode::Kind::File, entry));
        }
    }
    return node;
}

void TreeBuilder::add_error(TreeNode& node, const std::filesystem::path& path, std::error_code ec) {
    Logger::instance().debug("cannot read {}: {}", path.string(), ec.message());
    TreeNode error;
    error.kind = TreeNode::Kind::PermissionError;
    error.label = path.string();
    error.path = path;
    error.error = ec;
    node.add_child(std::move(error));
}

} // namespace dirtree
