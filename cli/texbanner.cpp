// FILE: cli/texbanner.cpp
#include <iostream>

#include "cli/run_texbanner.hpp"

int main(int argc, char** argv) {
    return run_texbanner(argc, argv, std::cin, std::cout, std::cerr);
}
