/**
 * lexiclean CLI - Entry Point
 *
 * Lexical path cleaning from the command line.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace lexiclean::cli::commands {
    void setup_clean(CLI::App* app, GlobalOptions& opts);
    void setup_components(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace lexiclean::cli;

    CLI::App app{"lexiclean - lexical path cleaning"};
    app.set_version_flag("-V,--version", LEXICLEAN_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--style", opts.style, "Path style: posix or windows (env LEXICLEAN_STYLE)");
    app.add_option("--empty", opts.empty, "Result for a fully cancelled path: dot or preserve (env LEXICLEAN_EMPTY)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log each step to stderr");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");

    // Commands
    auto* clean_cmd = app.add_subcommand("clean", "Print the cleaned form of each path");
    commands::setup_clean(clean_cmd, opts);

    auto* components_cmd = app.add_subcommand("components", "Show the components of a path");
    commands::setup_components(components_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Fail if any path is not already clean");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
