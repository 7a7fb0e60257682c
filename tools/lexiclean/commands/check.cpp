/**
 * lexiclean CLI - check command
 *
 * Exit 0 when every path is already in clean form.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace lexiclean::cli::commands {

namespace {

struct CheckOptions {
    std::vector<std::string> paths;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_logging(opts);

    auto options = resolve_clean_options(opts);
    if (!options) {
        return 1;
    }

    auto inputs = collect_inputs(check_opts.paths);
    nlohmann::json unclean = nlohmann::json::array();
    bool parse_failed = false;

    for (const auto& input : inputs) {
        auto r = lexiclean::lexiclean(input, *options);
        if (!r.ok) {
            spdlog::error("Cannot check '{}': {}", input, parse_error_to_string(r.error));
            parse_failed = true;
            continue;
        }
        if (r.path != input) {
            unclean.push_back(nlohmann::json{{"input", input}, {"clean", r.path}});
            if (!opts.json) {
                std::cout << input << " -> " << r.path << std::endl;
            }
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = unclean.empty() && !parse_failed;
        j["checked"] = inputs.size();
        j["unclean"] = unclean;
        output_json(j);
    } else if (unclean.empty() && !parse_failed) {
        spdlog::info("{} path(s) already clean", inputs.size());
    }

    return unclean.empty() && !parse_failed ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("paths", check_opts.paths, "Paths to check (reads stdin when omitted)");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace lexiclean::cli::commands
