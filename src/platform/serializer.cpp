#include "lexiclean/serializer.hpp"

#include <cctype>

namespace lexiclean {

namespace {

// A leading "C:..." name would read back as a drive prefix
bool reads_as_drive(const std::string& name) {
    return name.size() >= 2 &&
           std::isalpha(static_cast<unsigned char>(name[0])) &&
           name[1] == ':';
}

} // namespace

std::string serialize_path(const Path& path, PathStyle style) {
    const char sep = separator(style);
    std::string out;
    bool need_separator = false;

    for (const auto& c : path) {
        if (std::holds_alternative<Prefix>(c)) {
            out += std::get<Prefix>(c).text;
            need_separator = false;
        } else if (std::holds_alternative<RootDir>(c)) {
            out += sep;
            need_separator = false;
        } else {
            if (need_separator) {
                out += sep;
            } else if (out.empty() && style == PathStyle::Windows &&
                       std::holds_alternative<Normal>(c) &&
                       reads_as_drive(std::get<Normal>(c).name)) {
                out += '.';
                out += sep;
            }
            out += to_string(c);
            need_separator = true;
        }
    }

    return out;
}

} // namespace lexiclean
