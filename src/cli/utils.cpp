#include "utils.hpp"

#include <iomanip>

namespace wheels::cli {

namespace {

void print_command(std::ostream& out, const std::string& name, const std::string& description) {
    out << "    " << std::left << std::setw(HELP_COMMAND_WIDTH) << name << " " << description
        << "\n";
}

} // namespace

void print_version(std::ostream& out) {
    out << "You are using " << WheelsOptions::program_name << " version " << VERSION << "\n";
}

void print_missing_terraform_help(std::ostream& out) {
    out << "Your system does not have terraform installed, or its version is not\n";
    out << "compatible with our " << WheelsOptions::required_terraform_prefix
        << "x requirements. This means we cannot show you\n";
    out << "the terraform help screen.\n";
    out << "\n";
    out << "Set WHEELS_TERRAFORM_BIN or place a terraform binary in the project\n";
    out << "directory to enable it. The following commands are still available:\n";
}

void print_plugin_help(std::ostream& out, const plugin::PluginRegistry& registry) {
    out << "\n";
    out << "DC/OS Commands:\n";
    print_command(out, "wheels-version", "Check the version of " + WheelsOptions::program_name);
    print_command(out, "wheels-upgrade",
                  "Upgrade to the latest version of " + WheelsOptions::program_name);

    for (const auto& registered : registry.commands()) {
        print_command(out, registered.command.name, registered.command.description);
    }
}

void print_init_hint(std::ostream& out) {
    const auto& prog = WheelsOptions::program_name;
    out << "\n";
    out << "Consider running " << prog << " add-aws-cluster if you are trying to\n";
    out << "launch a DC/OS cluster. Or " << prog << " -help to see all options\n";
}

} // namespace wheels::cli
