#pragma once

#include "dirtree/theme.hpp"
#include "dirtree/tree.hpp"

#include <ostream>

namespace dirtree {

class Renderer {
public:
    Renderer(const Theme& theme, std::ostream& stream);

    void render(const TreeNode& root) const;

private:
    const Theme& theme_;
    std::ostream& out_;
};

} // namespace dirtree
