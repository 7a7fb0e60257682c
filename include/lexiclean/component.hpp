#pragma once

/**
 * @file component.hpp
 * @brief Typed path components
 *
 * A path is handled as an ordered sequence of components rather than as a
 * string. The set of component kinds is closed: every consumer visits all
 * five alternatives of the variant.
 *
 * @example
 * ```cpp
 * #include <lexiclean/component.hpp>
 *
 * lexiclean::Path p = {lexiclean::root_dir(), lexiclean::normal("usr")};
 * ```
 */

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lexiclean {

/// Absolute-path root marker (a leading separator)
struct RootDir {};

/// Volume or drive marker (e.g. "C:" or "\\server\share"); the parser stores it with "\" separators
struct Prefix {
    std::string text;
};

/// "." marker
struct CurDir {};

/// ".." marker
struct ParentDir {};

/// Named segment; name is never empty
struct Normal {
    std::string name;
};

inline bool operator==(const RootDir&, const RootDir&) { return true; }
inline bool operator==(const Prefix& a, const Prefix& b) { return a.text == b.text; }
inline bool operator==(const CurDir&, const CurDir&) { return true; }
inline bool operator==(const ParentDir&, const ParentDir&) { return true; }
inline bool operator==(const Normal& a, const Normal& b) { return a.name == b.name; }

inline bool operator!=(const RootDir& a, const RootDir& b) { return !(a == b); }
inline bool operator!=(const Prefix& a, const Prefix& b) { return !(a == b); }
inline bool operator!=(const CurDir& a, const CurDir& b) { return !(a == b); }
inline bool operator!=(const ParentDir& a, const ParentDir& b) { return !(a == b); }
inline bool operator!=(const Normal& a, const Normal& b) { return !(a == b); }

using Component = std::variant<RootDir, Prefix, CurDir, ParentDir, Normal>;

/// Ordered sequence of components; equality is element-wise
using Path = std::vector<Component>;

// ============================================================================
// Component Kinds
// ============================================================================

enum class ComponentKind {
    RootDir,
    Prefix,
    CurDir,
    ParentDir,
    Normal
};

ComponentKind kind_of(const Component& c);

// Convert kind enum to its canonical name ("root_dir", "prefix", ...)
inline const char* kind_to_string(ComponentKind k) {
    switch (k) {
        case ComponentKind::RootDir: return "root_dir";
        case ComponentKind::Prefix: return "prefix";
        case ComponentKind::CurDir: return "cur_dir";
        case ComponentKind::ParentDir: return "parent_dir";
        case ComponentKind::Normal: return "normal";
        default: return "unknown";
    }
}

// ============================================================================
// Constructors
// ============================================================================

inline Component root_dir() { return RootDir{}; }
inline Component prefix(std::string text) { return Prefix{std::move(text)}; }
inline Component cur_dir() { return CurDir{}; }
inline Component parent_dir() { return ParentDir{}; }
inline Component normal(std::string name) { return Normal{std::move(name)}; }

// ============================================================================
// Queries
// ============================================================================

/// True for RootDir and Prefix: components a following ".." cannot cancel
bool is_anchor(const Component& c);

/**
 * @brief Textual form of a single component
 *
 * RootDir has no text of its own (its separator depends on the path style)
 * and yields an empty string.
 */
std::string to_string(const Component& c);

/// Debug form of a path, e.g. `[root_dir, normal("foo")]`
std::string describe(const Path& path);

} // namespace lexiclean
