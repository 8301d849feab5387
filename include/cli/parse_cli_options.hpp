// FILE: include/cli/parse_cli_options.hpp
#pragma once
#include <string>
#include <vector>
#include "banner_types.hpp"

struct CliOptions {
    tb::BannerParameters params;
    std::vector<std::string> title_tokens;
    bool show_help = false;
    bool show_manual = false;
};

// Parses argv with getopt_long. argv may be permuted.
// Throws tb::BannerError (OptionError) on unknown options, missing
// arguments or malformed values.
CliOptions parse_cli_options(int argc, char** argv);
