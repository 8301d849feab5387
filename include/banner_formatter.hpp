// Title normalization, centering and banner assembly
#pragma once

#include <iosfwd>
#include <string>

#include "banner_types.hpp"

namespace tb {

// Uppercase, expand tabs to 8 spaces, put a space after every character
// and strip trailing whitespace.
std::string normalize_title(const std::string& title);

/**
 * @brief Center an already spaced title between two markers.
 * @param spaced_title output of normalize_title().
 * @param params width and marker are used.
 * @return a line of exactly params.width characters.
 * @throws BannerError (FitError) if the title plus the two markers exceed
 *         the width, or the width is below 2.
 */
std::string fit_title_line(const std::string& spaced_title, const BannerParameters& params);

// Full banner for a raw title: pad, rank, title line, rank, pad.
BannerLines format_banner(const std::string& title, const BannerParameters& params = {});

void write_banner(std::ostream& out, const BannerLines& lines);

} // namespace tb
