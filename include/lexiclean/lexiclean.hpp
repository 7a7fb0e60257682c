#pragma once

/**
 * @file lexiclean.hpp
 * @brief Lexical path cleaning
 *
 * Simplifies paths without looking at the filesystem:
 * - "foo/.." cleans to "." even if "foo" is a regular file
 * - no system calls are made, so cleaning cannot fail on I/O
 * - the result only contains components present in the input, so "foo/.."
 *   stays "." rather than becoming an unrelated absolute directory
 * - symlinks are not followed
 *
 * @example
 * ```cpp
 * #include <lexiclean/lexiclean.hpp>
 *
 * auto r = lexiclean::lexiclean("/usr/./lib/../bin");
 * if (r.ok) {
 *     // r.path == "/usr/bin"
 * }
 * ```
 */

#include "lexiclean/component.hpp"
#include "lexiclean/normalize.hpp"
#include "lexiclean/parser.hpp"
#include "lexiclean/path_style.hpp"
#include "lexiclean/serializer.hpp"

#include <string>

namespace lexiclean {

struct CleanOptions {
    PathStyle style = native_style();
    EmptyPolicy empty = EmptyPolicy::CurDir;
};

struct CleanResult {
    bool ok;
    std::string path;  // cleaned path when ok
    ParseError error;
};

/**
 * @brief Parse, normalize and serialize a path string
 * @param text Path in the given style
 * @param options Path style and empty-result policy
 * @return Cleaned path, or the parse error
 */
CleanResult lexiclean(const std::string& text, const CleanOptions& options = {});

} // namespace lexiclean
