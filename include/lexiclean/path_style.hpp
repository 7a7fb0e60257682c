#pragma once

#include <optional>
#include <string>

namespace lexiclean {

// ============================================================================
// Path Style
// ============================================================================

enum class PathStyle {
    Posix,    // "/" separator, no prefixes
    Windows   // "\" or "/" separator, drive and UNC prefixes
};

// Style of the platform this was built for
PathStyle native_style();

// Preferred separator when serializing
inline char separator(PathStyle style) {
    return style == PathStyle::Windows ? '\\' : '/';
}

inline const char* style_to_string(PathStyle style) {
    switch (style) {
        case PathStyle::Posix: return "posix";
        case PathStyle::Windows: return "windows";
        default: return "unknown";
    }
}

// Parse style name (case-insensitive): "posix"/"unix" or "windows"/"win"
std::optional<PathStyle> parse_style(const std::string& name);

} // namespace lexiclean
