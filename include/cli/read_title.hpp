// FILE: include/cli/read_title.hpp
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

// A lone "-" token reads the first line of `in`; otherwise the tokens are
// joined with single spaces.
std::string read_title(const std::vector<std::string>& tokens, std::istream& in);
