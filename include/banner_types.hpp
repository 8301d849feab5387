#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace tb {

struct BannerParameters {
    int width = 80;
    int rank = 2;   // blank bordered lines above and below the title
    int pad = 1;    // fully filled lines at top and bottom
    char marker = '%';
};

using BannerLines = std::vector<std::string>;

enum class BannerErrc {
    Unknown = 1, OptionError, FitError,
};
struct BannerError : public std::runtime_error {
    explicit BannerError(const std::string& what)
        : std::runtime_error(what), code_(BannerErrc::Unknown) {}
    BannerError(BannerErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    BannerErrc code() const noexcept { return code_; }
private:
    BannerErrc code_;
};

} // namespace tb
