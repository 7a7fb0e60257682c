#include "lexiclean/normalize.hpp"

namespace lexiclean {

Path normalize(const Path& input, const NormalizeOptions& options) {
    // A lone component is already clean
    if (input.size() == 1) {
        return input;
    }

    Path out;
    out.reserve(input.size());

    for (const auto& c : input) {
        if (std::holds_alternative<CurDir>(c)) {
            continue;
        }
        if (std::holds_alternative<ParentDir>(c)) {
            if (out.empty() || std::holds_alternative<ParentDir>(out.back())) {
                out.push_back(c);
            } else if (std::holds_alternative<Normal>(out.back())) {
                out.pop_back();
            }
            // Parent of an anchor is the anchor itself
            continue;
        }
        out.push_back(c);
    }

    if (out.empty() && options.empty == EmptyPolicy::CurDir) {
        out.push_back(CurDir{});
    }
    return out;
}

bool is_normalized(const Path& path, const NormalizeOptions& options) {
    return normalize(path, options) == path;
}

} // namespace lexiclean
