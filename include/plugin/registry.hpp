//! # Plugin Registry
//!
//! Owns the plugin instances for one process and the command table built
//! from them. Constructed once by the entry point and passed by reference.
//!
//! When two plugins contribute a command with the same name, the first
//! registered keeps it and a warning is logged.

#pragma once

#include "plugin/plugin.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wheels::plugin {

/// A command together with the plugin that contributed it.
struct RegisteredCommand {
    Command command;
    const Plugin* owner = nullptr;
};

class PluginRegistry {
public:
    explicit PluginRegistry(std::vector<Box<Plugin>> plugins);

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /// Plugins in registration order.
    [[nodiscard]] auto plugins() const -> const std::vector<Box<Plugin>>& {
        return plugins_;
    }

    /// Every contributed command in registration order, duplicates included.
    [[nodiscard]] auto commands() const -> const std::vector<RegisteredCommand>& {
        return commands_;
    }

    /// Looks up a command by name. Returns nullptr if none is registered.
    [[nodiscard]] auto find_command(std::string_view name) const -> const RegisteredCommand*;

private:
    std::vector<Box<Plugin>> plugins_;
    std::vector<RegisteredCommand> commands_;
    std::map<std::string, size_t, std::less<>> by_name_;
};

} // namespace wheels::plugin
