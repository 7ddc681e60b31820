//! # dcos-aws Plugin
//!
//! `add-aws-cluster` writes `main.tf` with a `module "dcos"` block sourced
//! from the dcos-terraform AWS module. Running it again regenerates the
//! block body with the newly supplied flags and keeps everything else.

#include "log/log.hpp"
#include "plugin/builtin.hpp"

#include <iostream>

namespace wheels::plugin {

namespace {

auto default_pre_lines() -> std::vector<std::string> {
    return {
        "provider \"aws\" {",
        "region = \"us-east-1\"",
        "}",
        "",
        "data \"http\" \"whatismyip\" {",
        "url = \"http://whatismyip.akamai.com/\"",
        "}",
        "",
        std::string(DcosAwsPlugin::MODULE_HEADER) + " {",
    };
}

auto default_body_lines() -> std::vector<std::string> {
    return {
        "source = \"" + std::string(DcosAwsPlugin::MODULE_SOURCE) + "\"",
        "version = \"~> 0.2.0\"",
        "",
        "providers = {",
        "aws = \"aws\"",
        "}",
        "",
        "cluster_name = \"dcos-example\"",
        "ssh_public_key_file = \"~/.ssh/id_rsa.pub\"",
        "admin_ips = [\"${data.http.whatismyip.body}/32\"]",
        "",
        "num_masters = \"1\"",
        "num_private_agents = \"2\"",
        "num_public_agents = \"1\"",
        "",
        "dcos_version = \"1.13.3\"",
        "dcos_instance_os = \"centos_7.5\"",
    };
}

} // namespace

auto DcosAwsPlugin::make_config() -> tfgen::TerraformFileConfig {
    tfgen::TerraformFileConfig cfg("add-aws-cluster");
    auto& f = cfg.flags;
    f.define("cluster_name", "dcos-example",
             "Name of the DC/OS cluster. Used as a prefix for every AWS resource created.");
    f.define("num_masters", "1", "Number of master nodes. Use 1, 3 or 5.");
    f.define("num_private_agents", "2", "Number of private agent nodes.");
    f.define("num_public_agents", "1", "Number of public agent nodes.");
    f.define("dcos_version", "1.13.3", "DC/OS version to install.");
    f.define("ssh_public_key_file", "~/.ssh/id_rsa.pub",
             "Path to the SSH public key installed on every node. The matching private key "
             "must be loaded in ssh-agent.");
    f.define("instance_type", "m5.xlarge", "AWS instance type used for the cluster nodes.");
    f.define("admin_ips", "",
             "CIDR allowed to reach the admin endpoints. Repeat the flag to allow more than "
             "one network.");
    f.define("tags", "", "Extra AWS tag as key=value. Repeat the flag for more tags.");
    cfg.list_flags.insert("admin_ips");
    cfg.map_flags.insert("tags");
    return cfg;
}

auto DcosAwsPlugin::add_cluster(const std::vector<std::string>& args, Sandbox& sandbox,
                                ToolHandle& /*tool*/) -> Result<bool> {
    auto cfg = make_config();
    return write_generated_file(sandbox, cfg, args, FILE_NAME, MODULE_HEADER, default_pre_lines(),
                                default_body_lines(), {"}"}, std::cout);
}

auto DcosAwsPlugin::commands() const -> std::vector<Command> {
    return {
        Command{"add-aws-cluster", "Create or update a DC/OS cluster on AWS", &add_cluster},
    };
}

auto DcosAwsPlugin::is_used(Sandbox& sandbox) -> Result<bool> {
    return sandbox.project_contains(MODULE_SOURCE);
}

auto DcosAwsPlugin::before_run(Sandbox& sandbox, ToolHandle& /*tool*/, bool is_init)
    -> Result<bool> {
    if (!is_init && !sandbox.file_exists(".terraform")) {
        return Error("project is not initialized, run init first");
    }
    return true;
}

auto DcosAwsPlugin::after_run(Sandbox& /*sandbox*/, ToolHandle& /*tool*/,
                              const std::optional<Error>& run_error) -> Result<bool> {
    if (run_error) {
        WHEELS_LOG_DEBUG("dcos-aws", "Terraform run failed, nothing to clean up");
    }
    return true;
}

} // namespace wheels::plugin
