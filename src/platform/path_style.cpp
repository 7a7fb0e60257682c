#include "lexiclean/path_style.hpp"

#include <algorithm>
#include <cctype>

namespace lexiclean {

PathStyle native_style() {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

std::optional<PathStyle> parse_style(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "posix" || lower == "unix") {
        return PathStyle::Posix;
    }
    if (lower == "windows" || lower == "win") {
        return PathStyle::Windows;
    }
    return std::nullopt;
}

} // namespace lexiclean
