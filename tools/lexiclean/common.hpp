/**
 * lexiclean CLI - Common utilities and types
 */

#pragma once

#include <lexiclean/lexiclean.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <optional>
#include <vector>
#include <iostream>
#include <cstdlib>

namespace lexiclean::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string style;             // --style
    std::string empty;             // --empty
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route spdlog to stderr so stdout carries only results.
 * -v enables debug records, -q keeps errors only.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("lexiclean");
    if (!logger) {
        logger = spdlog::stderr_color_mt("lexiclean");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^%l%$: %v");

    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Resolve the path style.
 * Priority: --style flag > LEXICLEAN_STYLE env > native style
 */
inline std::optional<PathStyle> resolve_style(const GlobalOptions& opts) {
    // 1. Explicit flag; an unknown name is an error
    if (!opts.style.empty()) {
        return parse_style(opts.style);
    }

    // 2. Environment variable; an unknown name falls back to native
    std::string env_style = safe_getenv("LEXICLEAN_STYLE");
    if (!env_style.empty()) {
        auto style = parse_style(env_style);
        if (style) {
            return style;
        }
        spdlog::warn("Ignoring LEXICLEAN_STYLE={}: expected posix or windows", env_style);
    }

    // 3. Default
    return native_style();
}

inline std::optional<EmptyPolicy> parse_empty_policy(const std::string& name) {
    if (name == "dot") return EmptyPolicy::CurDir;
    if (name == "preserve") return EmptyPolicy::Preserve;
    return std::nullopt;
}

/**
 * Resolve the empty-result policy.
 * Priority: --empty flag > LEXICLEAN_EMPTY env > "dot"
 */
inline std::optional<EmptyPolicy> resolve_empty_policy(const GlobalOptions& opts) {
    if (!opts.empty.empty()) {
        return parse_empty_policy(opts.empty);
    }

    std::string env_empty = safe_getenv("LEXICLEAN_EMPTY");
    if (!env_empty.empty()) {
        auto policy = parse_empty_policy(env_empty);
        if (policy) {
            return policy;
        }
        spdlog::warn("Ignoring LEXICLEAN_EMPTY={}: expected dot or preserve", env_empty);
    }

    return EmptyPolicy::CurDir;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Build CleanOptions from global options, reporting bad flag values.
 */
inline std::optional<CleanOptions> resolve_clean_options(const GlobalOptions& opts) {
    auto style = resolve_style(opts);
    if (!style) {
        print_error("Unknown path style: " + opts.style, opts.json);
        return std::nullopt;
    }
    auto empty = resolve_empty_policy(opts);
    if (!empty) {
        print_error("Unknown empty policy: " + opts.empty, opts.json);
        return std::nullopt;
    }

    CleanOptions options;
    options.style = *style;
    options.empty = *empty;
    spdlog::debug("style={} empty={}", style_to_string(options.style),
                  options.empty == EmptyPolicy::CurDir ? "dot" : "preserve");
    return options;
}

/**
 * Paths given on the command line, or one per stdin line when none are given.
 */
inline std::vector<std::string> collect_inputs(const std::vector<std::string>& args) {
    if (!args.empty()) {
        return args;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    spdlog::debug("Read {} path(s) from stdin", lines.size());
    return lines;
}

/**
 * JSON form of one component: {"kind": ..., "value": ...}
 */
inline nlohmann::json component_to_json(const Component& c, PathStyle style) {
    nlohmann::json j;
    j["kind"] = kind_to_string(kind_of(c));
    if (std::holds_alternative<RootDir>(c)) {
        j["value"] = std::string(1, separator(style));
    } else {
        j["value"] = to_string(c);
    }
    return j;
}

inline nlohmann::json path_to_json(const Path& path, PathStyle style) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : path) {
        arr.push_back(component_to_json(c, style));
    }
    return arr;
}

} // namespace lexiclean::cli
