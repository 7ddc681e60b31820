#include "cli/dispatcher.hpp"
#include "cli/utils.hpp"
#include "plugin/builtin.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace wheels;
using namespace wheels::cli;
using namespace wheels::plugin;

using Args = std::vector<std::string>;
using Events = std::vector<std::string>;

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        WheelsOptions::program_name = "tfwheels";
        sandbox.tool.events = &events;

        auto plugin = std::make_unique<fakes::ScriptedPlugin>("scaffold", &events);
        scaffold = plugin.get();
        scaffold->command_list = {
            {"scaffold", "Write main.tf",
             [this](const Args& args, Sandbox& sb, ToolHandle&) -> Result<bool> {
                 handler_args = args;
                 events.push_back("handler");
                 if (handler_error) {
                     return Error(*handler_error);
                 }
                 return sb.write_file("main.tf", "module \"dcos\" {\n}\n");
             }},
        };

        std::vector<Box<Plugin>> plugins;
        plugins.push_back(std::move(plugin));
        registry = std::make_unique<PluginRegistry>(std::move(plugins));
    }

    auto run(const Args& args) -> int {
        Dispatcher dispatcher(*registry, sandbox, out, err);
        return dispatcher.run(args);
    }

    Events events;
    fakes::FakeSandbox sandbox;
    fakes::ScriptedPlugin* scaffold = nullptr;
    Box<PluginRegistry> registry;
    std::ostringstream out;
    std::ostringstream err;
    Args handler_args;
    std::optional<std::string> handler_error;
};

// ============================================================================
// Plugin Commands
// ============================================================================

TEST_F(DispatcherTest, FirstScaffoldRunsInitOnce) {
    EXPECT_EQ(run({"scaffold", "-x=1"}), 0);

    EXPECT_EQ(handler_args, (Args{"-x=1"}));
    EXPECT_EQ(sandbox.reloads, 1);
    ASSERT_EQ(sandbox.tool.calls.size(), 1u);
    EXPECT_EQ(sandbox.tool.calls[0], (Args{"init"}));
    EXPECT_TRUE(scaffold->last_is_init);
    EXPECT_EQ(events, (Events{"handler", "scaffold:is_used", "scaffold:before_run", "terraform",
                              "scaffold:after_run"}));
    EXPECT_EQ(out.str(), "Terraform project created, initializing now\nUsing plugin scaffold\n");
    EXPECT_EQ(err.str(), "");
}

TEST_F(DispatcherTest, ExistingProjectIsNotReinitialized) {
    sandbox.files["variables.tf"] = "";

    EXPECT_EQ(run({"scaffold"}), 0);
    EXPECT_EQ(events, (Events{"handler"}));
    EXPECT_EQ(sandbox.reloads, 0);
    EXPECT_TRUE(sandbox.tool.calls.empty());
}

TEST_F(DispatcherTest, NonTerraformFileDoesNotCountAsProject) {
    sandbox.files["README.md"] = "";

    EXPECT_EQ(run({"scaffold"}), 0);
    ASSERT_EQ(sandbox.tool.calls.size(), 1u);
    EXPECT_EQ(sandbox.tool.calls[0], (Args{"init"}));
}

TEST_F(DispatcherTest, HandlerErrorIsFatal) {
    handler_error = "flag provided but not defined: -region";

    EXPECT_EQ(run({"scaffold", "-region=x"}), 1);
    EXPECT_EQ(err.str(), "Error: flag provided but not defined: -region\n");
    EXPECT_TRUE(sandbox.tool.calls.empty());
}

TEST_F(DispatcherTest, PluginCommandNeedsTerraform) {
    sandbox.terraform_available = false;

    EXPECT_EQ(run({"scaffold"}), 1);
    EXPECT_EQ(err.str(), "Error: terraform binary not found\n");
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(sandbox.files.empty());
}

TEST_F(DispatcherTest, InitHookFailureIsFatal) {
    scaffold->before_error = "SSH_AUTH_SOCK is not set";

    EXPECT_EQ(run({"scaffold"}), 1);
    EXPECT_EQ(err.str(), "Error: could not start scaffold: SSH_AUTH_SOCK is not set\n");
    // The file is already written
    EXPECT_TRUE(sandbox.file_exists("main.tf"));
}

// ============================================================================
// Passthrough
// ============================================================================

TEST_F(DispatcherTest, PassthroughForwardsFullArguments) {
    sandbox.files["main.tf"] = "";
    ASSERT_TRUE(is_ok(sandbox.reload_terraform_project()));

    EXPECT_EQ(run({"-no-color", "plan", "-out=tfplan"}), 0);
    ASSERT_EQ(sandbox.tool.calls.size(), 1u);
    EXPECT_EQ(sandbox.tool.calls[0], (Args{"-no-color", "plan", "-out=tfplan"}));
    EXPECT_FALSE(scaffold->last_is_init);
    EXPECT_EQ(out.str().find("Consider running"), std::string::npos);
}

TEST_F(DispatcherTest, PassthroughInEmptyProjectPrintsHint) {
    scaffold->used = false;

    EXPECT_EQ(run({"init"}), 0);
    EXPECT_EQ(out.str(), "\nConsider running tfwheels add-aws-cluster if you are trying to\n"
                         "launch a DC/OS cluster. Or tfwheels -help to see all options\n");
}

TEST_F(DispatcherTest, TerraformFailureStillSucceeds) {
    sandbox.files["main.tf"] = "";
    sandbox.tool.fail_with = "terraform exited with status 1";

    EXPECT_EQ(run({"apply"}), 0);
    ASSERT_TRUE(scaffold->last_run_error.has_value());
    EXPECT_EQ(err.str(), "");
}

TEST_F(DispatcherTest, FinalizeErrorIsFatal) {
    sandbox.files["main.tf"] = "";
    scaffold->after_error = "cleanup failed";

    EXPECT_EQ(run({"apply"}), 1);
    EXPECT_EQ(err.str(), "Error: could not finalize scaffold: cleanup failed\n");
}

TEST_F(DispatcherTest, PassthroughNeedsTerraform) {
    sandbox.terraform_available = false;

    EXPECT_EQ(run({"plan"}), 1);
    EXPECT_EQ(err.str(), "Error: terraform binary not found\n");
}

// ============================================================================
// Help
// ============================================================================

TEST_F(DispatcherTest, HelpRunsBareTerraformThenListsCommands) {
    sandbox.tool.fail_with = "terraform exited with status 127";

    EXPECT_EQ(run({"--help"}), 1);
    ASSERT_EQ(sandbox.tool.calls.size(), 1u);
    EXPECT_TRUE(sandbox.tool.calls[0].empty());
    EXPECT_EQ(out.str(), "\nDC/OS Commands:\n"
                         "    wheels-version     Check the version of tfwheels\n"
                         "    wheels-upgrade     Upgrade to the latest version of tfwheels\n"
                         "    scaffold           Write main.tf\n");
    EXPECT_EQ(err.str(), "");
    EXPECT_TRUE(handler_args.empty());
}

TEST_F(DispatcherTest, HelpWithoutTerraformShowsNotice) {
    sandbox.terraform_available = false;

    EXPECT_EQ(run({}), 1);
    EXPECT_EQ(out.str().rfind("Your system does not have terraform installed", 0), 0u);
    EXPECT_NE(out.str().find("0.11.x"), std::string::npos);
    EXPECT_NE(out.str().find("    scaffold           Write main.tf\n"), std::string::npos);
}

TEST_F(DispatcherTest, UnknownCommandShowsHelp) {
    EXPECT_EQ(run({"frobnicate"}), 1);
    EXPECT_NE(out.str().find("DC/OS Commands:"), std::string::npos);
    EXPECT_TRUE(events.empty() || events == (Events{"terraform"}));
}

TEST(PluginHelpTest, ListsBuiltinCommands) {
    WheelsOptions::program_name = "tfwheels";
    auto registry = make_default_registry();

    std::ostringstream out;
    print_plugin_help(out, *registry);
    EXPECT_NE(out.str().find("    add-aws-cluster    Create or update a DC/OS cluster on AWS\n"),
              std::string::npos);
    EXPECT_NE(out.str().find("    add-service        Add a DC/OS package to the cluster\n"),
              std::string::npos);
}

TEST(VersionTest, PrintsProgramAndVersion) {
    WheelsOptions::program_name = "./tfwheels";
    std::ostringstream out;
    print_version(out);
    EXPECT_EQ(out.str(), "You are using ./tfwheels version 0.3.0\n");
    WheelsOptions::program_name = "tfwheels";
}
