#include "router.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace wheels::cli {

CommandRouter::CommandRouter(const plugin::PluginRegistry& registry) : registry_(registry) {}

auto CommandRouter::is_passthrough(std::string_view command) -> bool {
    return std::find(KNOWN_TERRAFORM_COMMANDS.begin(), KNOWN_TERRAFORM_COMMANDS.end(), command) !=
           KNOWN_TERRAFORM_COMMANDS.end();
}

auto CommandRouter::route(const std::vector<std::string>& args) const -> Route {
    Route result;

    if (args.empty()) {
        WHEELS_LOG_DEBUG("router", "No arguments, showing help");
        return result;
    }

    for (const auto& arg : args) {
        if (arg.find("help") != std::string::npos) {
            WHEELS_LOG_DEBUG("router", "Help requested by '" << arg << "'");
            return result;
        }
    }

    auto cmd_it = std::find_if(args.begin(), args.end(),
                               [](const std::string& arg) { return !arg.starts_with("-"); });
    if (cmd_it == args.end()) {
        WHEELS_LOG_DEBUG("router", "Only flags given, showing help");
        return result;
    }
    const std::string& command = *cmd_it;

    if (const auto* registered = registry_.find_command(command)) {
        WHEELS_LOG_DEBUG("router", "Command '" << command << "' handled by plugin "
                                               << registered->owner->name());
        result.kind = RouteKind::Plugin;
        result.command = registered;
        result.args.assign(cmd_it + 1, args.end());
        return result;
    }

    if (is_passthrough(command)) {
        WHEELS_LOG_DEBUG("router", "Command '" << command << "' passed to terraform");
        result.kind = RouteKind::Passthrough;
        result.args = args;
        return result;
    }

    WHEELS_LOG_INFO("router", "Unknown command '" << command << "', showing help");
    return result;
}

} // namespace wheels::cli
