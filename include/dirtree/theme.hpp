#pragma once

#include "dirtree/tree.hpp"

#include <string>
#include <string_view>

namespace dirtree {

class Theme {
public:
    explicit Theme(bool use_color);

    [[nodiscard]] bool use_color() const noexcept;

    [[nodiscard]] std::string_view color_for(TreeNode::Kind kind) const noexcept;
    [[nodiscard]] std::string icon_for(TreeNode::Kind kind) const;
    [[nodiscard]] std::string text_for(const TreeNode& node) const;

    // Icon, label and suffix with the kind's color applied.
    [[nodiscard]] std::string decorate(const TreeNode& node) const;

    static constexpr std::string_view reset_color() noexcept { return "\033[0m"; }

private:
    bool use_color_{false};
};

} // namespace dirtree
