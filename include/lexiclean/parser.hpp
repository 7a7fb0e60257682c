#pragma once

#include "lexiclean/component.hpp"
#include "lexiclean/path_style.hpp"

#include <string>

namespace lexiclean {

enum class ParseError {
    None,
    ContainsNul,
};

inline const char* parse_error_to_string(ParseError e) {
    switch (e) {
        case ParseError::None: return "none";
        case ParseError::ContainsNul: return "path contains NUL byte";
        default: return "unknown";
    }
}

struct ParseResult {
    bool ok;
    Path path;  // components in source order when ok
    ParseError error;
};

// Split a path string into typed components.
// - Rejects NUL bytes
// - Repeated and trailing separators produce no components
// - Windows style recognizes drive letters, UNC and verbatim prefixes; prefix
//   text is rewritten with single "\" separators
// - After a verbatim "\\?\" prefix only "\" separates segments
// - Never validates "." / ".." placement; that is left to normalize()
ParseResult parse_path(const std::string& text, PathStyle style);

} // namespace lexiclean
