// FILE: src/cli/parse_cli_options.cpp
#include "cli/parse_cli_options.hpp"

#include <cctype>
#include <getopt.h>
#include <stdexcept>

using tb::BannerErrc;
using tb::BannerError;

namespace {

constexpr int kOptManual = 1001;

int parse_int_arg(const std::string& name, const char* value) {
    std::string s = value ? value : "";
    size_t pos = 0;
    int result = 0;
    // std::stoi would skip leading whitespace and accept a '+' sign.
    if (s.empty() || !(s[0] == '-' || std::isdigit(static_cast<unsigned char>(s[0])))) {
        throw BannerError(BannerErrc::OptionError,
                          "option --" + name + " expects an integer, got '" + s + "'");
    }
    try {
        result = std::stoi(s, &pos, 10);
    } catch (const std::invalid_argument&) {
        pos = 0;
    } catch (const std::out_of_range&) {
        throw BannerError(BannerErrc::OptionError,
                          "value '" + s + "' for --" + name + " is out of range");
    }
    if (s.empty() || pos != s.size()) {
        throw BannerError(BannerErrc::OptionError,
                          "option --" + name + " expects an integer, got '" + s + "'");
    }
    return result;
}

int parse_count_arg(const std::string& name, const char* value) {
    int n = parse_int_arg(name, value);
    if (n < 0) {
        throw BannerError(BannerErrc::OptionError,
                          "option --" + name + " must not be negative, got " + std::to_string(n));
    }
    return n;
}

std::string offending_option(int argc, char** argv) {
    if (optopt > 0 && optopt != kOptManual) return std::string("-") + static_cast<char>(optopt);
    if (optind > 0 && optind <= argc) return argv[optind - 1];
    return "?";
}

} // namespace

CliOptions parse_cli_options(int argc, char** argv) {
    CliOptions opts;

    const char* const short_opts = ":hw:r:p:m:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"width", required_argument, nullptr, 'w'},
        {"rank", required_argument, nullptr, 'r'}, {"pad", required_argument, nullptr, 'p'},
        {"marker", required_argument, nullptr, 'm'}, {"manual", no_argument, nullptr, kOptManual},
        {nullptr, 0, nullptr, 0}
    };

    // 0 makes glibc reinitialize its scan state, so repeated calls are safe.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': opts.show_help = true; break;
        case kOptManual: opts.show_manual = true; break;
        case 'w': opts.params.width = parse_int_arg("width", optarg); break;
        case 'r': opts.params.rank = parse_count_arg("rank", optarg); break;
        case 'p': opts.params.pad = parse_count_arg("pad", optarg); break;
        case 'm': {
            std::string m = optarg ? optarg : "";
            if (m.size() != 1) {
                throw BannerError(BannerErrc::OptionError,
                                  "option --marker expects a single character, got '" + m + "'");
            }
            opts.params.marker = m[0];
            break; }
        case ':':
            throw BannerError(BannerErrc::OptionError,
                              "option '" + offending_option(argc, argv) + "' requires an argument");
        case '?':
        default:
            throw BannerError(BannerErrc::OptionError,
                              "unrecognized option '" + offending_option(argc, argv) + "'");
        }
    }

    for (int i = optind; i < argc; ++i) {
        opts.title_tokens.emplace_back(argv[i]);
    }
    return opts;
}
