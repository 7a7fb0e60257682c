#include "lexiclean/lexiclean.hpp"

namespace lexiclean {

CleanResult lexiclean(const std::string& text, const CleanOptions& options) {
    auto parsed = parse_path(text, options.style);
    if (!parsed.ok) {
        return {false, {}, parsed.error};
    }

    NormalizeOptions normalize_options;
    normalize_options.empty = options.empty;

    auto cleaned = normalize(parsed.path, normalize_options);
    return {true, serialize_path(cleaned, options.style), ParseError::None};
}

} // namespace lexiclean
