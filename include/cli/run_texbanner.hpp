// FILE: include/cli/run_texbanner.hpp
#pragma once
#include <iosfwd>

// Parses argv, builds the banner and writes it to `out`. Diagnostics go to
// `err`. Returns the process exit status: 0 on success, 1 on an option
// error, 2 when the title does not fit or anything else fails.
int run_texbanner(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err);
