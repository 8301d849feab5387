// FILE: src/cli/run_texbanner.cpp
#include "cli/run_texbanner.hpp"

#include <exception>
#include <iostream>
#include <string>

#include "banner_formatter.hpp"
#include "cli/parse_cli_options.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/read_title.hpp"

int run_texbanner(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err) {
    CliOptions opts;
    try {
        opts = parse_cli_options(argc, argv);
    } catch (const tb::BannerError& e) {
        err << "Error: " << e.what() << "\n"
            << "Try 'texbanner --help' for more information.\n";
        return 1;
    }

    if (opts.show_help) { print_cli_help(out); return 0; }
    if (opts.show_manual) { print_cli_manual(out); return 0; }

    try {
        const std::string title = read_title(opts.title_tokens, in);
        // Built completely before writing so a failure leaves `out` empty.
        tb::BannerLines lines = tb::format_banner(title, opts.params);
        tb::write_banner(out, lines);
    } catch (const tb::BannerError& e) {
        err << "Error: " << e.what() << "\n";
        return e.code() == tb::BannerErrc::OptionError ? 1 : 2;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 2;
    }
    out.flush();
    return out ? 0 : 2;
}
