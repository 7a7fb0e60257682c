#pragma once

#include "lexiclean/component.hpp"
#include "lexiclean/path_style.hpp"

#include <string>

namespace lexiclean {

// Join components back into a path string using the style's separator.
// Prefix text is emitted as written; RootDir emits one separator.
// The empty sequence serializes to "".
// In Windows style a leading name such as "C:x" is written as ".\C:x" so it
// does not read back as a drive.
std::string serialize_path(const Path& path, PathStyle style);

} // namespace lexiclean
