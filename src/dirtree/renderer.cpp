#include "dirtree/renderer.hpp"

#include <string>
#include <vector>

namespace dirtree {

Renderer::Renderer(const Theme& theme, std::ostream& stream)
    : theme_{theme}
    , out_{stream} {}

void Renderer::render(const TreeNode& root) const {
    struct StackItem {
        const TreeNode* node;
        std::size_t index{0};
        std::string prefix;
    };

    out_ << theme_.decorate(root) << '\n';

    std::vector<StackItem> stack;
    stack.push_back(StackItem{&root, 0, ""});

    while (!stack.empty()) {
        auto& current = stack.back();
        const auto& children = current.node->children;
        if (current.index >= children.size()) {
            stack.pop_back();
            continue;
        }

        const TreeNode& child = children[current.index];
        const bool last = current.index + 1 == children.size();
        ++current.index;

        out_ << current.prefix << (last ? "└── " : "├── ") << theme_.decorate(child) << '\n';

        if (!child.children.empty()) {
            std::string next_prefix = current.prefix + (last ? "    " : "│   ");
            stack.push_back(StackItem{&child, 0, std::move(next_prefix)});
        }
    }
}

} // namespace dirtree
