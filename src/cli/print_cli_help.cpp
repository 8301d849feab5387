// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help(std::ostream& out) {
  out << "Usage: texbanner [options] TITLE...\n"
      << "       texbanner [options] -\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "      --manual               Show the full manual\n"
      << "  -w, --width <int>          Banner width (default 80)\n"
      << "  -r, --rank <int>           Blank bordered lines around the title "
         "(default 2)\n"
      << "  -p, --pad <int>            Filled lines at top and bottom "
         "(default 1)\n"
      << "  -m, --marker <char>        Border and fill character (default %)\n"
      << std::endl;
}

void print_cli_manual(std::ostream& out) {
  out << "NAME\n"
      << "    texbanner - print a boxed section banner for source comments\n\n"
      << "SYNOPSIS\n"
      << "    texbanner [-w width] [-r rank] [-p pad] [-m char] TITLE...\n"
      << "    texbanner [-w width] [-r rank] [-p pad] [-m char] -\n\n"
      << "DESCRIPTION\n"
      << "    The title words are joined with single spaces. A single '-'\n"
      << "    reads the title from the first line of standard input; further\n"
      << "    lines are ignored.\n\n"
      << "    The title is upper-cased, each tab becomes eight spaces and a\n"
      << "    space is put after every character. The result is centered\n"
      << "    between two marker characters; when the margins cannot be equal\n"
      << "    the left one gets the extra space. Every line of the banner is\n"
      << "    exactly WIDTH characters long.\n\n"
      << "    Layout, top to bottom: PAD filled lines, RANK bordered blank\n"
      << "    lines, the title line, RANK bordered blank lines, PAD filled\n"
      << "    lines.\n\n"
      << "OPTIONS\n"
      << "    -w, --width=INT   Banner width. Default 80.\n"
      << "    -r, --rank=INT    Blank bordered lines above and below the\n"
      << "                      title. Default 2.\n"
      << "    -p, --pad=INT     Filled lines at the very top and bottom.\n"
      << "                      Default 1.\n"
      << "    -m, --marker=CHAR Character used for borders and fill lines.\n"
      << "                      Default '%'.\n"
      << "    -h, --help        Print a short usage summary and exit.\n"
      << "        --manual      Print this manual and exit.\n\n"
      << "EXAMPLE\n"
      << "    $ texbanner -w 21 the end\n"
      << "    %%%%%%%%%%%%%%%%%%%%%\n"
      << "    %                   %\n"
      << "    %                   %\n"
      << "    %   T H E   E N D   %\n"
      << "    %                   %\n"
      << "    %                   %\n"
      << "    %%%%%%%%%%%%%%%%%%%%%\n\n"
      << "EXIT STATUS\n"
      << "    0  banner, help or manual printed\n"
      << "    1  invalid command-line option\n"
      << "    2  title does not fit in the requested width\n"
      << std::endl;
}
