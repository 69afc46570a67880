#pragma once

#include <string_view>

#ifndef DIRTREE_VERSION_STRING
#define DIRTREE_VERSION_STRING "0.0"
#endif

namespace dirtree {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{DIRTREE_VERSION_STRING}; }
};

} // namespace dirtree
