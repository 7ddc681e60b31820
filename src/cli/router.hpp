//! # Command Router
//!
//! Decides who handles an argument vector (argv[0] excluded):
//!
//! ```text
//! []  or any arg containing "help"     -> Help
//! first non-flag token
//!   ├─ registered plugin command        -> Plugin (args after the token)
//!   ├─ known terraform command          -> Passthrough (full vector)
//!   └─ anything else / none             -> Help
//! ```
//!
//! Leading flags are skipped when looking for the command, so
//! `-chdir=x plan` routes `plan`.

#pragma once

#include "plugin/registry.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace wheels::cli {

/// Terraform commands forwarded unchanged.
constexpr std::array<std::string_view, 24> KNOWN_TERRAFORM_COMMANDS = {
    "apply",   "console", "destroy",  "env",           "fmt",   "get",
    "graph",   "import",  "init",     "output",        "plan",  "providers",
    "push",    "refresh", "show",     "taint",         "untaint", "validate",
    "version", "workspace", "0.12checklist", "debug", "force-unlock", "state",
};

enum class RouteKind {
    Help,
    Plugin,
    Passthrough,
};

/// Routing decision for one invocation.
struct Route {
    RouteKind kind = RouteKind::Help;
    /// Set for `RouteKind::Plugin`.
    const plugin::RegisteredCommand* command = nullptr;
    /// Handler arguments for plugins, the full vector for passthrough.
    std::vector<std::string> args;
};

class CommandRouter {
public:
    explicit CommandRouter(const plugin::PluginRegistry& registry);

    [[nodiscard]] auto route(const std::vector<std::string>& args) const -> Route;

    [[nodiscard]] static auto is_passthrough(std::string_view command) -> bool;

private:
    const plugin::PluginRegistry& registry_;
};

} // namespace wheels::cli
