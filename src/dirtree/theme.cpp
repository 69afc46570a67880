#include "dirtree/theme.hpp"

#include <system_error>

namespace dirtree {

Theme::Theme(bool use_color)
    : use_color_{use_color} {}

bool Theme::use_color() const noexcept {
    return use_color_;
}

std::string_view Theme::color_for(TreeNode::Kind kind) const noexcept {
    if (!use_color_) {
        return {};
    }
    switch (kind) {
    case TreeNode::Kind::Root:
        return "\033[1;36m"; // bold cyan
    case TreeNode::Kind::Directory:
        return "\033[1;34m"; // bold blue
    case TreeNode::Kind::PermissionError:
        return "\033[31m"; // red
    case TreeNode::Kind::File:
        break;
    }
    return {};
}

std::string Theme::icon_for(TreeNode::Kind kind) const {
    switch (kind) {
    case TreeNode::Kind::Directory:
        return "\U0001F4C2"; // open folder
    case TreeNode::Kind::File:
        return "\U0001F4C4"; // page
    case TreeNode::Kind::PermissionError:
        return "\u26A0\uFE0F"; // warning sign
    case TreeNode::Kind::Root:
        break;
    }
    return {};
}

std::string Theme::text_for(const TreeNode& node) const {
    switch (node.kind) {
    case TreeNode::Kind::Root:
    case TreeNode::Kind::Directory:
        return node.label + "/";
    case TreeNode::Kind::PermissionError:
        if (node.error == std::errc::permission_denied || !node.error) {
            return "Permission denied: " + node.label;
        }
        return node.error.message() + ": " + node.label;
    case TreeNode::Kind::File:
        break;
    }
    return node.label;
}

std::string Theme::decorate(const TreeNode& node) const {
    std::string decorated = text_for(node);
    const std::string icon = icon_for(node.kind);
    if (!icon.empty()) {
        decorated = icon + " " + decorated;
    }
    const auto color = color_for(node.kind);
    if (!color.empty()) {
        decorated = std::string{color} + decorated + std::string{reset_color()};
    }
    return decorated;
}

} // namespace dirtree
