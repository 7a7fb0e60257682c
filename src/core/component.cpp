#include "lexiclean/component.hpp"

#include <sstream>
#include <type_traits>

namespace lexiclean {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

ComponentKind kind_of(const Component& c) {
    return std::visit(overloaded{
        [](const RootDir&) { return ComponentKind::RootDir; },
        [](const Prefix&) { return ComponentKind::Prefix; },
        [](const CurDir&) { return ComponentKind::CurDir; },
        [](const ParentDir&) { return ComponentKind::ParentDir; },
        [](const Normal&) { return ComponentKind::Normal; },
    }, c);
}

bool is_anchor(const Component& c) {
    return std::holds_alternative<RootDir>(c) || std::holds_alternative<Prefix>(c);
}

std::string to_string(const Component& c) {
    return std::visit(overloaded{
        [](const RootDir&) { return std::string(); },
        [](const Prefix& p) { return p.text; },
        [](const CurDir&) { return std::string("."); },
        [](const ParentDir&) { return std::string(".."); },
        [](const Normal& n) { return n.name; },
    }, c);
}

std::string describe(const Path& path) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out << ", ";
        const auto& c = path[i];
        out << kind_to_string(kind_of(c));
        if (std::holds_alternative<Prefix>(c) || std::holds_alternative<Normal>(c)) {
            out << "(\"" << to_string(c) << "\")";
        }
    }
    out << "]";
    return out.str();
}

} // namespace lexiclean
