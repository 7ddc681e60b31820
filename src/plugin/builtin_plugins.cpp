#include "log/log.hpp"
#include "plugin/builtin.hpp"

#include <algorithm>

namespace wheels::plugin {

auto wants_option_help(const std::vector<std::string>& args) -> bool {
    return std::any_of(args.begin(), args.end(), [](const std::string& arg) {
        return arg == "-options" || arg == "--options";
    });
}

auto write_generated_file(Sandbox& sandbox, tfgen::TerraformFileConfig& cfg,
                          const std::vector<std::string>& args, const std::string& file_name,
                          std::string_view header, std::vector<std::string> default_pre,
                          std::vector<std::string> default_body,
                          std::vector<std::string> default_post, std::ostream& out)
    -> Result<bool> {
    if (wants_option_help(args)) {
        out << "Options for " << cfg.flags.name() << ":\n";
        cfg.print_option_help(out);
        return true;
    }

    auto parsed = cfg.flags.parse(args);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    bool existed = sandbox.file_exists(file_name);
    if (existed) {
        auto content = sandbox.read_file(file_name);
        if (is_err(content)) {
            return unwrap_err(content);
        }
        auto sections = tfgen::split_block(unwrap(content), header);
        if (is_err(sections)) {
            return unwrap_err(sections).wrap(file_name);
        }
        auto& parts = unwrap(sections);
        cfg.pre_lines = std::move(parts.pre);
        cfg.body_lines = std::move(parts.body);
        cfg.post_lines = std::move(parts.post);
        WHEELS_LOG_DEBUG("plugin", "Regenerating " << file_name << " from "
                                                   << cfg.body_lines.size() << " body lines");
    } else {
        cfg.pre_lines = std::move(default_pre);
        cfg.body_lines = std::move(default_body);
        cfg.post_lines = std::move(default_post);
    }

    auto generated = cfg.generate();
    if (is_err(generated)) {
        return unwrap_err(generated);
    }

    auto written = sandbox.write_file(file_name, unwrap(generated));
    if (is_err(written)) {
        return unwrap_err(written);
    }

    out << (existed ? "Updated " : "Created ") << file_name << "\n";
    return true;
}

auto make_default_registry() -> Box<PluginRegistry> {
    std::vector<Box<Plugin>> plugins;
    plugins.push_back(make_box<DcosAwsPlugin>());
    plugins.push_back(make_box<SshAgentPlugin>());
    plugins.push_back(make_box<DcosServicesPlugin>());
    return make_box<PluginRegistry>(std::move(plugins));
}

} // namespace wheels::plugin
