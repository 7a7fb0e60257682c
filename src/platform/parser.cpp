#include "lexiclean/parser.hpp"

#include <cctype>
#include <utility>

namespace lexiclean {

namespace {

// Characters that split segments
enum class Separators {
    Slash,      // POSIX: "/"
    Any,        // Windows: "\" or "/"
    Backslash   // Windows after a verbatim "\\?\" prefix: "/" is an ordinary character
};

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c, Separators seps) {
    switch (seps) {
        case Separators::Slash: return c == '/';
        case Separators::Any: return c == '/' || c == '\\';
        case Separators::Backslash: return c == '\\';
        default: return false;
    }
}

// End of the segment starting at `from` (exclusive)
size_t segment_end(const std::string& s, size_t from, Separators seps) {
    size_t i = from;
    while (i < s.size() && !is_separator(s[i], seps)) ++i;
    return i;
}

size_t skip_separators(const std::string& s, size_t from, Separators seps) {
    size_t i = from;
    while (i < s.size() && is_separator(s[i], seps)) ++i;
    return i;
}

bool is_drive(const std::string& s, size_t at) {
    return s.size() >= at + 2 &&
           std::isalpha(static_cast<unsigned char>(s[at])) &&
           s[at + 1] == ':';
}

// "UNC\" right after a verbatim marker
bool starts_with_unc(const std::string& s, size_t at) {
    if (s.size() < at + 4) return false;
    return std::toupper(static_cast<unsigned char>(s[at])) == 'U' &&
           std::toupper(static_cast<unsigned char>(s[at + 1])) == 'N' &&
           std::toupper(static_cast<unsigned char>(s[at + 2])) == 'C' &&
           s[at + 3] == '\\';
}

struct WindowsPrefix {
    size_t length = 0;        // characters consumed; 0 when there is no prefix
    std::string text;         // canonical form, "\" separated
    bool implies_root = false;
    bool verbatim = false;
};

// "server" ends at server_end; an optional share follows after any run of
// separators. An empty share is not part of the prefix.
WindowsPrefix with_share(const std::string& s, size_t server_end, std::string head,
                         Separators seps, bool verbatim) {
    size_t share_start = skip_separators(s, server_end, seps);
    size_t share_end = segment_end(s, share_start, seps);
    if (share_end == share_start) {
        return {server_end, std::move(head), true, verbatim};
    }
    return {share_end, head + "\\" + s.substr(share_start, share_end - share_start), true, verbatim};
}

// After "\\?\": UNC\server\share, C:, or any other name up to the next "\"
WindowsPrefix scan_verbatim(const std::string& s) {
    const auto seps = Separators::Backslash;
    const size_t at = 4;

    if (starts_with_unc(s, at)) {
        size_t server_start = skip_separators(s, at + 4, seps);
        size_t server_end = segment_end(s, server_start, seps);
        if (server_end == server_start) {
            return {at + 3, "\\\\?\\UNC", true, true};
        }
        return with_share(s, server_end,
                          "\\\\?\\UNC\\" + s.substr(server_start, server_end - server_start),
                          seps, true);
    }
    if (is_drive(s, at) && (s.size() == at + 2 || s[at + 2] == '\\')) {
        return {at + 2, "\\\\?\\" + s.substr(at, 2), true, true};
    }

    size_t end = segment_end(s, at, seps);
    if (end == at) {
        return {};
    }
    return {end, "\\\\?\\" + s.substr(at, end - at), true, true};
}

// Recognizes:
//   \\?\UNC\server\share   \\?\C:   \\?\name   (verbatim)
//   \\.\device                                  (device namespace)
//   \\server\share                              (UNC)
//   C:                                          (drive)
// A marker with an empty name ("\\?\", "\\.\") is not a prefix; the path is
// then read as a plain rooted path.
WindowsPrefix scan_windows_prefix(const std::string& s) {
    const auto seps = Separators::Any;

    if (s.size() < 2 || !is_separator(s[0], seps) || !is_separator(s[1], seps)) {
        if (is_drive(s, 0)) {
            return {2, s.substr(0, 2), false, false};
        }
        return {};
    }

    bool has_marker = s.size() >= 4 && (s[2] == '?' || s[2] == '.') && is_separator(s[3], seps);
    if (has_marker && s[2] == '?') {
        return scan_verbatim(s);
    }
    if (has_marker) {
        size_t end = segment_end(s, 4, seps);
        if (end == 4) {
            return {};
        }
        return {end, "\\\\.\\" + s.substr(4, end - 4), true, false};
    }

    if (s.size() > 2 && !is_separator(s[2], seps)) {
        size_t server_end = segment_end(s, 2, seps);
        std::string server = s.substr(2, server_end - 2);
        // "\\?" and "\\." alone are markers without a name
        if (server == "?" || server == ".") {
            return {};
        }
        return with_share(s, server_end, "\\\\" + server, seps, false);
    }
    return {};
}

Component classify(const std::string& segment) {
    if (segment == ".") return CurDir{};
    if (segment == "..") return ParentDir{};
    return Normal{segment};
}

} // namespace

ParseResult parse_path(const std::string& text, PathStyle style) {
    if (contains_nul(text)) {
        return {false, {}, ParseError::ContainsNul};
    }

    Path components;
    size_t pos = 0;
    bool has_root = false;
    Separators seps = style == PathStyle::Windows ? Separators::Any : Separators::Slash;

    if (style == PathStyle::Windows) {
        auto prefix = scan_windows_prefix(text);
        if (prefix.length > 0) {
            components.push_back(Prefix{prefix.text});
            pos = prefix.length;
            has_root = prefix.implies_root;
            if (prefix.verbatim) {
                seps = Separators::Backslash;
            }
        }
    }

    if (pos < text.size() && is_separator(text[pos], seps)) {
        has_root = true;
    }
    if (has_root) {
        components.push_back(RootDir{});
    }

    while (pos < text.size()) {
        size_t end = segment_end(text, pos, seps);
        if (end > pos) {
            components.push_back(classify(text.substr(pos, end - pos)));
        }
        pos = end + 1;
    }

    return {true, components, ParseError::None};
}

} // namespace lexiclean
