// FILE: include/cli/print_cli_help.hpp
#pragma once
#include <iostream>

void print_cli_help(std::ostream& out = std::cout);
void print_cli_manual(std::ostream& out = std::cout);
