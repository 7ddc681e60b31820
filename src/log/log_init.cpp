//! # Log Initialization from CLI
//!
//! Parses the `--wheels-log-*` options and the WHEELS_LOG environment
//! variable to produce a LogConfig. The options are prefixed so they never
//! collide with terraform's own single-dash flags.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace wheels::log {

namespace {

constexpr std::string_view LEVEL_OPT = "--wheels-log-level=";
constexpr std::string_view FILTER_OPT = "--wheels-log-filter=";
constexpr std::string_view FILE_OPT = "--wheels-log-file=";
constexpr std::string_view FORMAT_OPT = "--wheels-log-format=";

bool is_log_option(const std::string& arg) {
    return arg.starts_with(LEVEL_OPT) || arg.starts_with(FILTER_OPT) ||
           arg.starts_with(FILE_OPT) || arg.starts_with(FORMAT_OPT);
}

} // namespace

LogConfig parse_log_options(const std::vector<std::string>& args) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;

    for (const auto& arg : args) {
        if (arg.starts_with(LEVEL_OPT)) {
            config.level = parse_level(arg.substr(LEVEL_OPT.size()));
            has_cli_level = true;
        } else if (arg.starts_with(FILTER_OPT)) {
            config.filter_spec = arg.substr(FILTER_OPT.size());
            has_cli_filter = true;
        } else if (arg.starts_with(FILE_OPT)) {
            config.log_file = arg.substr(FILE_OPT.size());
        } else if (arg.starts_with(FORMAT_OPT)) {
            std::string fmt = arg.substr(FORMAT_OPT.size());
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        }
    }

    // WHEELS_LOG is a fallback only
    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("WHEELS_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // A '=' or ',' means a filter spec, otherwise a single level name
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

std::vector<std::string> strip_log_options(const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    rest.reserve(args.size());
    for (const auto& arg : args) {
        if (!is_log_option(arg)) {
            rest.push_back(arg);
        }
    }
    return rest;
}

} // namespace wheels::log
