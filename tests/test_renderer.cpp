#include <gtest/gtest.h>

#include "dirtree/renderer.hpp"
#include "dirtree/theme.hpp"

#include <sstream>
#include <string>

using namespace dirtree;
using Kind = TreeNode::Kind;

namespace {

TreeNode leaf(Kind kind, std::string label) {
    TreeNode node;
    node.kind = kind;
    node.label = std::move(label);
    return node;
}

std::string render(const TreeNode& tree, bool color = false) {
    std::ostringstream out;
    const Theme theme(color);
    Renderer(theme, out).render(tree);
    return out.str();
}

} // namespace

TEST(Renderer, DrawsGuidesForNestedEntries) {
    TreeNode tree = TreeNode::root("project");
    auto& src = tree.add_child(leaf(Kind::Directory, "src"));
    src.add_child(leaf(Kind::File, "a.py"));
    tree.add_child(leaf(Kind::File, "readme.md"));

    EXPECT_EQ(render(tree),
        "project/\n"
        "├── 📂 src/\n"
        "│   └── 📄 a.py\n"
        "└── 📄 readme.md\n");
}

TEST(Renderer, LastBranchUsesBlankContinuation) {
    TreeNode tree = TreeNode::root("r");
    tree.add_child(leaf(Kind::File, "first"));
    auto& last = tree.add_child(leaf(Kind::Directory, "last"));
    auto& inner = last.add_child(leaf(Kind::Directory, "inner"));
    inner.add_child(leaf(Kind::File, "deep.txt"));
    last.add_child(leaf(Kind::File, "tail.txt"));

    EXPECT_EQ(render(tree),
        "r/\n"
        "├── 📄 first\n"
        "└── 📂 last/\n"
        "    ├── 📂 inner/\n"
        "    │   └── 📄 deep.txt\n"
        "    └── 📄 tail.txt\n");
}

TEST(Renderer, EmptyRootPrintsOnlyItself) {
    EXPECT_EQ(render(TreeNode::root("/tmp/empty")), "/tmp/empty/\n");
}

TEST(Renderer, PermissionErrorLeaf) {
    TreeNode tree = TreeNode::root("r");
    auto& locked = tree.add_child(leaf(Kind::Directory, "locked"));
    auto error = leaf(Kind::PermissionError, "r/locked");
    error.error = std::make_error_code(std::errc::permission_denied);
    locked.add_child(error);

    EXPECT_EQ(render(tree),
        "r/\n"
        "└── 📂 locked/\n"
        "    └── ⚠️ Permission denied: r/locked\n");
}

TEST(Renderer, ColorWrapsEachLabel) {
    TreeNode tree = TreeNode::root("r");
    tree.add_child(leaf(Kind::Directory, "d"));
    tree.add_child(leaf(Kind::File, "f"));

    EXPECT_EQ(render(tree, true),
        "\033[1;36mr/\033[0m\n"
        "├── \033[1;34m📂 d/\033[0m\n"
        "└── 📄 f\n");
}

TEST(Theme, NoEscapesWithoutColor) {
    const Theme theme(false);
    for (auto kind : {Kind::Root, Kind::Directory, Kind::File, Kind::PermissionError}) {
        EXPECT_TRUE(theme.color_for(kind).empty());
        EXPECT_EQ(theme.decorate(leaf(kind, "x")).find('\033'), std::string::npos);
    }
}

TEST(Theme, OtherFailuresShowTheirMessage) {
    const Theme theme(false);
    auto error = leaf(Kind::PermissionError, "/gone");
    error.error = std::make_error_code(std::errc::no_such_file_or_directory);
    EXPECT_EQ(theme.text_for(error), error.error.message() + ": /gone");
}
