#include "banner_formatter.hpp"

#include <cctype>
#include <ostream>

namespace tb {

namespace {

constexpr int kTabWidth = 8;

// Rounds toward negative infinity, unlike the built-in operator.
int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int floor_mod(int a, int b) {
    return a - floor_div(a, b) * b;
}

bool is_trailing_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string normalize_title(const std::string& title) {
    std::string expanded;
    expanded.reserve(title.size());
    for (char c : title) {
        if (c == '\t') {
            expanded.append(kTabWidth, ' ');
        } else {
            expanded.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }

    std::string spaced;
    spaced.reserve(expanded.size() * 2);
    for (char c : expanded) {
        spaced.push_back(c);
        spaced.push_back(' ');
    }

    while (!spaced.empty() && is_trailing_space(spaced.back())) {
        spaced.pop_back();
    }
    return spaced;
}

std::string fit_title_line(const std::string& spaced_title, const BannerParameters& params) {
    const int width = params.width;
    if (width < 2) {
        throw BannerError(BannerErrc::FitError,
                          "width " + std::to_string(width) + " leaves no room for the border");
    }
    const int extra = width - static_cast<int>(spaced_title.size());
    const int side = floor_div(extra - 2, 2);
    if (side < 0) {
        throw BannerError(BannerErrc::FitError,
                          "title does not fit in width " + std::to_string(width));
    }

    std::string line;
    line.reserve(static_cast<size_t>(width));
    line.push_back(params.marker);
    line.append(static_cast<size_t>(side + floor_mod(extra, 2)), ' ');
    line += spaced_title;
    line.append(static_cast<size_t>(side), ' ');
    line.push_back(params.marker);
    return line;
}

BannerLines format_banner(const std::string& title, const BannerParameters& params) {
    if (params.rank < 0 || params.pad < 0) {
        throw BannerError(BannerErrc::OptionError, "rank and pad must not be negative");
    }
    const std::string title_line = fit_title_line(normalize_title(title), params);

    const auto width = static_cast<size_t>(params.width);
    const std::string fill(width, params.marker);
    std::string blank(width, ' ');
    blank.front() = params.marker;
    blank.back() = params.marker;

    BannerLines lines;
    lines.reserve(2 * (static_cast<size_t>(params.pad) + static_cast<size_t>(params.rank)) + 1);
    lines.insert(lines.end(), static_cast<size_t>(params.pad), fill);
    lines.insert(lines.end(), static_cast<size_t>(params.rank), blank);
    lines.push_back(title_line);
    lines.insert(lines.end(), static_cast<size_t>(params.rank), blank);
    lines.insert(lines.end(), static_cast<size_t>(params.pad), fill);
    return lines;
}

void write_banner(std::ostream& out, const BannerLines& lines) {
    for (const auto& line : lines) {
        out << line << '\n';
    }
}

} // namespace tb
