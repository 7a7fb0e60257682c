/**
 * lexiclean CLI - components command
 *
 * Show how a path is split into components and what survives cleaning.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace lexiclean::cli::commands {

namespace {

struct ComponentsOptions {
    std::string path;
};

void print_components(const char* title, const Path& path, PathStyle style) {
    std::cout << title << ":" << std::endl;
    if (path.empty()) {
        std::cout << "  (empty)" << std::endl;
        return;
    }
    for (const auto& c : path) {
        std::cout << "  " << kind_to_string(kind_of(c));
        if (std::holds_alternative<RootDir>(c)) {
            std::cout << "  " << separator(style);
        } else {
            std::cout << "  " << to_string(c);
        }
        std::cout << std::endl;
    }
}

int cmd_components(const GlobalOptions& opts, const ComponentsOptions& comp_opts) {
    init_logging(opts);

    auto options = resolve_clean_options(opts);
    if (!options) {
        return 1;
    }

    auto parsed = parse_path(comp_opts.path, options->style);
    if (!parsed.ok) {
        print_error(std::string("Cannot parse path: ") + parse_error_to_string(parsed.error),
                    opts.json);
        return 1;
    }

    NormalizeOptions normalize_options;
    normalize_options.empty = options->empty;
    auto cleaned = normalize(parsed.path, normalize_options);
    spdlog::debug("parsed {} -> normalized {}", describe(parsed.path), describe(cleaned));

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["input"] = comp_opts.path;
        j["style"] = style_to_string(options->style);
        j["parsed"] = path_to_json(parsed.path, options->style);
        j["normalized"] = path_to_json(cleaned, options->style);
        j["output"] = serialize_path(cleaned, options->style);
        output_json(j);
    } else {
        print_components("Parsed", parsed.path, options->style);
        print_components("Normalized", cleaned, options->style);
        std::cout << "Output: " << serialize_path(cleaned, options->style) << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_components(CLI::App* app, GlobalOptions& opts) {
    static ComponentsOptions comp_opts;

    app->add_option("path", comp_opts.path, "Path to inspect")->required();

    app->callback([&opts]() {
        std::exit(cmd_components(opts, comp_opts));
    });
}

} // namespace lexiclean::cli::commands
