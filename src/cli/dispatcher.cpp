//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for tfwheels and the per
//! invocation dispatcher.
//!
//! ## Architecture
//!
//! ```text
//! wheels_main()
//!   ├─ --wheels-log-*            → Logger::init(), stripped from argv
//!   ├─ wheels-version            → print_version()
//!   ├─ wheels-upgrade            → run_upgrade()
//!   ├─ wheels-complete-upgrade   → run_complete_upgrade()
//!   └─ everything else           → Dispatcher::run()
//!        ├─ Help        → terraform help + DC/OS commands
//!        ├─ Plugin      → command handler, then first-scaffold init
//!        └─ Passthrough → plugin lifecycle around terraform
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                       |
//! |------|-----------------------------------------------|
//! | 0    | Success, including a failed terraform run     |
//! | 1    | Help shown, or a fatal error                  |

#include "dispatcher.hpp"

#include "driver.hpp"
#include "log/log.hpp"
#include "plugin/builtin.hpp"
#include "sandbox/project_sandbox.hpp"
#include "upgrade.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace wheels::cli {

Dispatcher::Dispatcher(const plugin::PluginRegistry& registry, sandbox::Sandbox& sandbox,
                       std::ostream& out, std::ostream& err)
    : registry_(registry), sandbox_(sandbox), out_(out), err_(err), router_(registry),
      lifecycle_(registry, out) {}

auto Dispatcher::fail(const Error& error) -> int {
    err_ << "Error: " << error.message << "\n";
    WHEELS_LOG_DEBUG("cli", "Fatal: " << error.message);
    return 1;
}

auto Dispatcher::show_help() -> int {
    if (sandbox_.has_terraform()) {
        auto tool = sandbox_.get_terraform();
        if (is_err(tool)) {
            return fail(unwrap_err(tool));
        }
        // Terraform prints its usage and exits non-zero when run bare
        auto shown = unwrap(tool)->invoke({});
        if (is_err(shown)) {
            WHEELS_LOG_DEBUG("cli", "Terraform help: " << unwrap_err(shown).message);
        }
    } else {
        print_missing_terraform_help(out_);
    }

    print_plugin_help(out_, registry_);
    return 1;
}

auto Dispatcher::run_plugin_command(const Route& route) -> Result<bool> {
    auto had_files = sandbox_.has_terraform_files();
    if (is_err(had_files)) {
        return unwrap_err(had_files);
    }

    auto tool = sandbox_.get_terraform();
    if (is_err(tool)) {
        return unwrap_err(tool);
    }

    const auto& command = route.command->command;
    WHEELS_LOG_INFO("cli", "Running " << command.name << " from plugin "
                                      << route.command->owner->name());
    auto handled = command.handler(route.args, sandbox_, *unwrap(tool));
    if (is_err(handled)) {
        return unwrap_err(handled);
    }

    auto has_files = sandbox_.has_terraform_files();
    if (is_err(has_files)) {
        return unwrap_err(has_files);
    }

    if (!unwrap(had_files) && unwrap(has_files)) {
        out_ << "Terraform project created, initializing now\n";

        auto reloaded = sandbox_.reload_terraform_project();
        if (is_err(reloaded)) {
            return unwrap_err(reloaded);
        }
        return lifecycle_.run(sandbox_, *unwrap(tool), {"init"});
    }
    return true;
}

auto Dispatcher::run_passthrough(const Route& route) -> Result<bool> {
    auto had_files = sandbox_.has_terraform_files();
    if (is_err(had_files)) {
        return unwrap_err(had_files);
    }

    auto tool = sandbox_.get_terraform();
    if (is_err(tool)) {
        return unwrap_err(tool);
    }

    auto ran = lifecycle_.run(sandbox_, *unwrap(tool), route.args);
    if (is_err(ran)) {
        return ran;
    }

    if (!unwrap(had_files)) {
        print_init_hint(out_);
    }
    return true;
}

auto Dispatcher::run(const std::vector<std::string>& args) -> int {
    auto route = router_.route(args);

    Result<bool> result = true;
    switch (route.kind) {
    case RouteKind::Help:
        return show_help();
    case RouteKind::Plugin:
        result = run_plugin_command(route);
        break;
    case RouteKind::Passthrough:
        result = run_passthrough(route);
        break;
    }

    if (is_err(result)) {
        return fail(unwrap_err(result));
    }
    return 0;
}

/// Main entry point for tfwheels.
///
/// ## Examples
///
/// ```bash
/// tfwheels add-aws-cluster -num_masters=3   # scaffold main.tf, then init
/// tfwheels plan                              # terraform plan with plugin hooks
/// tfwheels --wheels-log-level=debug apply   # verbose wrapper logs
/// ```
int wheels_main(int argc, char* argv[]) {
    std::vector<std::string> raw_args;
    for (int i = 1; i < argc; ++i) {
        raw_args.emplace_back(argv[i]);
    }

    log::Logger::init(log::parse_log_options(raw_args));
    auto args = log::strip_log_options(raw_args);

    if (argc > 0 && argv[0]) {
        WheelsOptions::program_name = argv[0];
    }
    if (const char* bin = std::getenv("WHEELS_TERRAFORM_BIN")) {
        WheelsOptions::terraform_bin = bin;
    }

    if (!args.empty()) {
        const auto& command = args[0];
        if (command == "wheels-version") {
            print_version(std::cout);
            return 0;
        }
        if (command == "wheels-upgrade") {
            return run_upgrade(std::cout, std::cerr);
        }
        if (command == "wheels-complete-upgrade") {
            return run_complete_upgrade(args, std::cout, std::cerr);
        }
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "Error: cannot determine the current directory: " << ec.message() << "\n";
        return 1;
    }

    auto opened = sandbox::ProjectSandbox::open(cwd);
    if (is_err(opened)) {
        std::cerr << "Error: " << unwrap_err(opened).message << "\n";
        return 1;
    }

    auto registry = plugin::make_default_registry();
    Dispatcher dispatcher(*registry, *unwrap(opened), std::cout, std::cerr);
    int rc = dispatcher.run(args);

    log::Logger::instance().flush();
    return rc;
}

} // namespace wheels::cli

int wheels_main(int argc, char* argv[]) {
    return wheels::cli::wheels_main(argc, argv);
}
