//! # Plugin Interface
//!
//! A plugin contributes commands of its own and hooks around every
//! terraform invocation in a project that uses it.
//!
//! ## Hook Order
//!
//! ```text
//! is_used(each) -> before_run(active...) -> terraform -> after_run(active...)
//! ```
//!
//! Plugins hold no state between invocations except what they write to the
//! project directory.

#pragma once

#include "common.hpp"
#include "sandbox/sandbox.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wheels::plugin {

using sandbox::Sandbox;
using sandbox::ToolHandle;

/// Signature of a plugin command handler.
///
/// `args` are the arguments after the command token.
using CommandHandler =
    std::function<Result<bool>(const std::vector<std::string>& args, Sandbox&, ToolHandle&)>;

/// A command contributed by a plugin.
struct Command {
    std::string name;
    std::string description;
    CommandHandler handler;
};

/// Abstract plugin.
class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Commands in the order they appear in help output.
    [[nodiscard]] virtual auto commands() const -> std::vector<Command> = 0;

    /// True if the project in `sandbox` uses this plugin.
    virtual auto is_used(Sandbox& sandbox) -> Result<bool> = 0;

    /// Runs before terraform. `is_init` is true when the delegated arguments
    /// contain `init`. An error aborts the invocation.
    virtual auto before_run(Sandbox& sandbox, ToolHandle& tool, bool is_init) -> Result<bool> = 0;

    /// Runs after terraform, with terraform's own error if it failed.
    virtual auto after_run(Sandbox& sandbox, ToolHandle& tool, const std::optional<Error>& run_error)
        -> Result<bool> = 0;
};

} // namespace wheels::plugin
