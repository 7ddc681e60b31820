//! # Dispatcher
//!
//! Runs one invocation against an opened sandbox: routes the arguments,
//! then shows help, runs a plugin command or forwards to terraform.
//!
//! ## First Scaffold
//!
//! When a plugin command creates the first `.tf` file of a project, the
//! dispatcher reloads the project and runs `init` through the plugin
//! lifecycle, once.

#pragma once

#include "plugin/lifecycle.hpp"
#include "router.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace wheels::cli {

class Dispatcher {
public:
    Dispatcher(const plugin::PluginRegistry& registry, sandbox::Sandbox& sandbox,
               std::ostream& out, std::ostream& err);

    /// Returns the process exit code.
    auto run(const std::vector<std::string>& args) -> int;

private:
    auto show_help() -> int;
    auto run_plugin_command(const Route& route) -> Result<bool>;
    auto run_passthrough(const Route& route) -> Result<bool>;
    auto fail(const Error& error) -> int;

    const plugin::PluginRegistry& registry_;
    sandbox::Sandbox& sandbox_;
    std::ostream& out_;
    std::ostream& err_;
    CommandRouter router_;
    plugin::PluginLifecycle lifecycle_;
};

} // namespace wheels::cli
