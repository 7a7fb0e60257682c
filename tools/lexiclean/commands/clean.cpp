/**
 * lexiclean CLI - clean command
 *
 * Print the lexically cleaned form of each path.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace lexiclean::cli::commands {

namespace {

struct CleanCommandOptions {
    std::vector<std::string> paths;
};

int cmd_clean(const GlobalOptions& opts, const CleanCommandOptions& clean_opts) {
    init_logging(opts);

    auto options = resolve_clean_options(opts);
    if (!options) {
        return 1;
    }

    auto inputs = collect_inputs(clean_opts.paths);
    nlohmann::json results = nlohmann::json::array();
    int status = 0;

    for (const auto& input : inputs) {
        auto r = lexiclean::lexiclean(input, *options);
        if (!r.ok) {
            spdlog::error("Cannot clean '{}': {}", input, parse_error_to_string(r.error));
            if (opts.json) {
                results.push_back(nlohmann::json{{"input", input}, {"ok", false},
                                                 {"error", parse_error_to_string(r.error)}});
            }
            status = 1;
            continue;
        }

        if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
            auto parsed = parse_path(input, options->style);
            spdlog::debug("'{}' ({} components) -> '{}'", input, parsed.path.size(), r.path);
        }
        if (opts.json) {
            results.push_back(nlohmann::json{{"input", input}, {"ok", true}, {"output", r.path}});
        } else {
            std::cout << r.path << std::endl;
        }
    }

    if (opts.json) {
        output_json(results);
    }
    return status;
}

} // anonymous namespace

void setup_clean(CLI::App* app, GlobalOptions& opts) {
    static CleanCommandOptions clean_opts;

    app->add_option("paths", clean_opts.paths, "Paths to clean (reads stdin when omitted)");

    app->callback([&opts]() {
        std::exit(cmd_clean(opts, clean_opts));
    });
}

} // namespace lexiclean::cli::commands
