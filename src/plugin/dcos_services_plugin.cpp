//! # dcos-services Plugin
//!
//! `add-service <name>` writes `service-<name>.tf` holding one
//! `dcos_package` resource. Package options are given as repeated
//! `-config key=value` flags and rendered as the `config` block.

#include "log/log.hpp"
#include "plugin/builtin.hpp"

#include <cctype>
#include <iostream>

namespace wheels::plugin {

namespace {

auto is_valid_service_name(const std::string& name) -> bool {
    if (name.empty() || !std::isalnum(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc) || c == '-' || c == '_')) {
            return false;
        }
    }
    return true;
}

auto resource_header(const std::string& service) -> std::string {
    return "resource \"dcos_package\" \"" + service + "\"";
}

} // namespace

auto DcosServicesPlugin::make_config(const std::string& service) -> tfgen::TerraformFileConfig {
    tfgen::TerraformFileConfig cfg("add-service");
    auto& f = cfg.flags;
    f.define("package_name", service, "Name of the package in the DC/OS catalog.");
    f.define("package_version", "",
             "Package version to install. The latest catalog version is used when empty.");
    f.define("app_id", service, "Marathon application ID the service is deployed under.");
    f.define("config", "",
             "Package option as key=value. Repeat the flag to set more than one option.");
    cfg.map_flags.insert("config");
    return cfg;
}

auto DcosServicesPlugin::add_service(const std::vector<std::string>& args, Sandbox& sandbox,
                                     ToolHandle& /*tool*/) -> Result<bool> {
    if (wants_option_help(args)) {
        auto cfg = make_config("<name>");
        return write_generated_file(sandbox, cfg, args, "", "", {}, {}, {}, std::cout);
    }

    if (args.empty() || args[0].starts_with("-")) {
        return Error("missing service name; usage: " + WheelsOptions::program_name +
                     " add-service <name> [options]");
    }
    const std::string& service = args[0];
    if (!is_valid_service_name(service)) {
        return Error("invalid service name '" + service +
                     "': use lowercase letters, digits, '-' and '_'");
    }

    auto cfg = make_config(service);
    std::vector<std::string> rest(args.begin() + 1, args.end());
    std::string header = resource_header(service);
    std::vector<std::string> body = {
        "app_id = \"" + service + "\"",
        "package_name = \"" + service + "\"",
    };

    WHEELS_LOG_INFO("dcos-services", "Generating service " << service);
    return write_generated_file(sandbox, cfg, rest, "service-" + service + ".tf", header,
                                {header + " {"}, std::move(body), {"}"}, std::cout);
}

auto DcosServicesPlugin::commands() const -> std::vector<Command> {
    return {
        Command{"add-service", "Add a DC/OS package to the cluster", &add_service},
    };
}

auto DcosServicesPlugin::is_used(Sandbox& sandbox) -> Result<bool> {
    return sandbox.project_contains("\"dcos_package\"");
}

auto DcosServicesPlugin::before_run(Sandbox& /*sandbox*/, ToolHandle& /*tool*/,
                                    bool /*is_init*/) -> Result<bool> {
    return true;
}

auto DcosServicesPlugin::after_run(Sandbox& /*sandbox*/, ToolHandle& /*tool*/,
                                   const std::optional<Error>& /*run_error*/) -> Result<bool> {
    return true;
}

} // namespace wheels::plugin
