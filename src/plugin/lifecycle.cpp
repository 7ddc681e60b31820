#include "plugin/lifecycle.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace wheels::plugin {

PluginLifecycle::PluginLifecycle(const PluginRegistry& registry, std::ostream& out)
    : registry_(registry), out_(out) {}

auto PluginLifecycle::load_plugins(Sandbox& sandbox) -> Result<std::vector<Plugin*>> {
    std::vector<Plugin*> active;
    for (const auto& plugin : registry_.plugins()) {
        auto used = plugin->is_used(sandbox);
        if (is_err(used)) {
            return unwrap_err(used);
        }
        if (unwrap(used)) {
            out_ << "Using plugin " << plugin->name() << "\n";
            active.push_back(plugin.get());
        }
    }
    WHEELS_LOG_DEBUG("lifecycle", active.size() << " of " << registry_.plugins().size()
                                                 << " plugins active");
    return active;
}

auto PluginLifecycle::invoke(Sandbox& sandbox, ToolHandle& tool,
                             const std::vector<Plugin*>& active,
                             const std::vector<std::string>& args) -> Result<bool> {
    bool is_init = std::find(args.begin(), args.end(), "init") != args.end();

    for (auto* plugin : active) {
        auto started = plugin->before_run(sandbox, tool, is_init);
        if (is_err(started)) {
            return unwrap_err(started).wrap("could not start " + plugin->name());
        }
    }

    std::optional<Error> run_error;
    auto ran = tool.invoke(args);
    if (is_err(ran)) {
        run_error = unwrap_err(ran);
        WHEELS_LOG_ERROR("lifecycle", "Terraform failed: " << run_error->message);
    }

    for (auto* plugin : active) {
        auto finished = plugin->after_run(sandbox, tool, run_error);
        if (is_err(finished)) {
            return unwrap_err(finished).wrap("could not finalize " + plugin->name());
        }
    }
    return true;
}

auto PluginLifecycle::run(Sandbox& sandbox, ToolHandle& tool,
                          const std::vector<std::string>& args) -> Result<bool> {
    auto active = load_plugins(sandbox);
    if (is_err(active)) {
        return unwrap_err(active);
    }
    return invoke(sandbox, tool, unwrap(active), args);
}

} // namespace wheels::plugin
