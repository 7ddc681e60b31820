//! # CLI Utilities Interface
//!
//! | Function                         | Description                         |
//! |----------------------------------|-------------------------------------|
//! | `print_version()`                | `wheels-version` output             |
//! | `print_missing_terraform_help()` | notice shown instead of tf help     |
//! | `print_plugin_help()`            | the `DC/OS Commands:` section       |
//! | `print_init_hint()`              | hint after a run in an empty project|

#pragma once

#include "plugin/registry.hpp"

#include <ostream>
#include <string>

namespace wheels::cli {

/// Width of the command column in help output.
constexpr int HELP_COMMAND_WIDTH = 18;

void print_version(std::ostream& out);
void print_missing_terraform_help(std::ostream& out);
void print_plugin_help(std::ostream& out, const plugin::PluginRegistry& registry);
void print_init_hint(std::ostream& out);

} // namespace wheels::cli
