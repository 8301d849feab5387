// FILE: src/cli/read_title.cpp
#include "cli/read_title.hpp"

#include <istream>

std::string read_title(const std::vector<std::string>& tokens, std::istream& in) {
    if (tokens.size() == 1 && tokens[0] == "-") {
        std::string line;
        std::getline(in, line);  // strips the '\n' only
        return line;
    }
    std::string title;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) title += ' ';
        title += tokens[i];
    }
    return title;
}
