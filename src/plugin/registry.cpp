#include "plugin/registry.hpp"

#include "log/log.hpp"

namespace wheels::plugin {

PluginRegistry::PluginRegistry(std::vector<Box<Plugin>> plugins) : plugins_(std::move(plugins)) {
    for (const auto& plugin : plugins_) {
        for (auto& cmd : plugin->commands()) {
            auto existing = by_name_.find(cmd.name);
            if (existing != by_name_.end()) {
                WHEELS_LOG_WARN("registry", "Command '"
                                                << cmd.name << "' from plugin " << plugin->name()
                                                << " is shadowed by plugin "
                                                << commands_[existing->second].owner->name());
            } else {
                by_name_.emplace(cmd.name, commands_.size());
            }
            commands_.push_back(RegisteredCommand{std::move(cmd), plugin.get()});
        }
    }
    WHEELS_LOG_DEBUG("registry", "Registered " << plugins_.size() << " plugins, "
                                               << by_name_.size() << " commands");
}

auto PluginRegistry::find_command(std::string_view name) const -> const RegisteredCommand* {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    return &commands_[it->second];
}

} // namespace wheels::plugin
