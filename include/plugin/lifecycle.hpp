//! # Plugin Lifecycle
//!
//! Runs one terraform invocation with the hooks of every plugin the project
//! uses.
//!
//! ## Failure Semantics
//!
//! | Stage       | On error                                            |
//! |-------------|-----------------------------------------------------|
//! | is_used     | fatal, nothing else runs                            |
//! | before_run  | fatal `could not start <plugin>`, no terraform      |
//! | terraform   | logged, handed to every after_run                   |
//! | after_run   | fatal `could not finalize <plugin>`                 |

#pragma once

#include "plugin/registry.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace wheels::plugin {

class PluginLifecycle {
public:
    PluginLifecycle(const PluginRegistry& registry, std::ostream& out);

    /// Returns the plugins the project uses, announcing each one.
    auto load_plugins(Sandbox& sandbox) -> Result<std::vector<Plugin*>>;

    /// Runs the hooks of `active` around `tool.invoke(args)`.
    auto invoke(Sandbox& sandbox, ToolHandle& tool, const std::vector<Plugin*>& active,
                const std::vector<std::string>& args) -> Result<bool>;

    /// `load_plugins` followed by `invoke`.
    auto run(Sandbox& sandbox, ToolHandle& tool, const std::vector<std::string>& args)
        -> Result<bool>;

private:
    const PluginRegistry& registry_;
    std::ostream& out_;
};

} // namespace wheels::plugin
