#include "dirtree/app.hpp"

#include <iostream>

int main(int argc, char** argv) {
    dirtree::App app(std::cin, std::cout);
    return app.run(argc, argv);
}
