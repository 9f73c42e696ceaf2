#include "daicgate/cli/app.hpp"

#include <iostream>

int main(int argc, char** argv) {
    daicgate::cli::App app(std::cin, std::cout, std::cerr);
    return app.run(argc, argv);
}
