#pragma once

#include <istream>
#include <ostream>

namespace dirtree {

class App {
public:
    App(std::istream& in, std::ostream& out);
    int run(int argc, char** argv);

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dirtree
