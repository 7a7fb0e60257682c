#pragma once

#include "lexiclean/component.hpp"

namespace lexiclean {

/// What normalize() returns when every component cancels out
enum class EmptyPolicy {
    CurDir,    ///< Return a single CurDir (default)
    Preserve   ///< Return the empty sequence
};

struct NormalizeOptions {
    EmptyPolicy empty = EmptyPolicy::CurDir;
};

/**
 * @brief Lexically clean a component sequence
 * @param input Components as produced by a parser; never modified
 * @param options Empty-result policy
 * @return A new sequence built only from components of the input
 *
 * Single left-to-right pass with the output used as a stack:
 * - CurDir is dropped
 * - ParentDir pops a preceding Normal, is absorbed by RootDir/Prefix, and is
 *   kept when nothing concrete precedes it
 * - RootDir, Prefix and Normal are pushed
 *
 * Does not touch the filesystem. "file/.." cleans to "." even when "file" is
 * not a directory.
 */
Path normalize(const Path& input, const NormalizeOptions& options = {});

/// True when normalize(path, options) == path
bool is_normalized(const Path& path, const NormalizeOptions& options = {});

} // namespace lexiclean
