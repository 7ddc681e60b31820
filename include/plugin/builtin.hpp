//! # Built-in Plugins
//!
//! | Plugin          | Commands          | Used when the project mentions |
//! |-----------------|-------------------|--------------------------------|
//! | `dcos-aws`      | `add-aws-cluster` | `dcos-terraform/dcos/aws`      |
//! | `ssh-agent`     | (none)            | `ssh_public_key_file`          |
//! | `dcos-services` | `add-service`     | `dcos_package`                 |
//!
//! Registration order is the order of the table.

#pragma once

#include "plugin/registry.hpp"
#include "tfgen/terraform_file.hpp"

#include <ostream>

namespace wheels::plugin {

// ============================================================================
// dcos-aws
// ============================================================================

/// Scaffolds a DC/OS cluster on AWS in `main.tf`.
class DcosAwsPlugin : public Plugin {
public:
    static constexpr const char* FILE_NAME = "main.tf";
    static constexpr const char* MODULE_HEADER = "module \"dcos\"";
    static constexpr const char* MODULE_SOURCE = "dcos-terraform/dcos/aws";

    [[nodiscard]] auto name() const -> std::string override {
        return "dcos-aws";
    }
    [[nodiscard]] auto commands() const -> std::vector<Command> override;
    auto is_used(Sandbox& sandbox) -> Result<bool> override;
    auto before_run(Sandbox& sandbox, ToolHandle& tool, bool is_init) -> Result<bool> override;
    auto after_run(Sandbox& sandbox, ToolHandle& tool, const std::optional<Error>& run_error)
        -> Result<bool> override;

    /// Generator for `add-aws-cluster`.
    [[nodiscard]] static auto make_config() -> tfgen::TerraformFileConfig;

    static auto add_cluster(const std::vector<std::string>& args, Sandbox& sandbox,
                            ToolHandle& tool) -> Result<bool>;
};

// ============================================================================
// ssh-agent
// ============================================================================

/// Requires a running ssh-agent when the cluster is provisioned with keys.
class SshAgentPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "ssh-agent";
    }
    [[nodiscard]] auto commands() const -> std::vector<Command> override {
        return {};
    }
    auto is_used(Sandbox& sandbox) -> Result<bool> override;
    auto before_run(Sandbox& sandbox, ToolHandle& tool, bool is_init) -> Result<bool> override;
    auto after_run(Sandbox& sandbox, ToolHandle& tool, const std::optional<Error>& run_error)
        -> Result<bool> override;
};

// ============================================================================
// dcos-services
// ============================================================================

/// Adds DC/OS packages as `dcos_package` resources, one file per service.
class DcosServicesPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "dcos-services";
    }
    [[nodiscard]] auto commands() const -> std::vector<Command> override;
    auto is_used(Sandbox& sandbox) -> Result<bool> override;
    auto before_run(Sandbox& sandbox, ToolHandle& tool, bool is_init) -> Result<bool> override;
    auto after_run(Sandbox& sandbox, ToolHandle& tool, const std::optional<Error>& run_error)
        -> Result<bool> override;

    /// Generator for `add-service <service>`.
    [[nodiscard]] static auto make_config(const std::string& service) -> tfgen::TerraformFileConfig;

    static auto add_service(const std::vector<std::string>& args, Sandbox& sandbox,
                            ToolHandle& tool) -> Result<bool>;
};

// ============================================================================
// Shared Helpers
// ============================================================================

/// True if `args` ask for the generator's option help (`-options`).
[[nodiscard]] auto wants_option_help(const std::vector<std::string>& args) -> bool;

/// Parses `args` into `cfg`, merges them into `file_name` (or into
/// `default_pre`/`default_body`/`default_post` when the file does not exist
/// yet) and writes the result back.
auto write_generated_file(Sandbox& sandbox, tfgen::TerraformFileConfig& cfg,
                          const std::vector<std::string>& args, const std::string& file_name,
                          std::string_view header, std::vector<std::string> default_pre,
                          std::vector<std::string> default_body,
                          std::vector<std::string> default_post, std::ostream& out)
    -> Result<bool>;

/// The built-in plugins in registration order.
auto make_default_registry() -> Box<PluginRegistry>;

} // namespace wheels::plugin
