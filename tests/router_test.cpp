#include "cli/router.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace wheels;
using namespace wheels::cli;
using namespace wheels::plugin;

using Args = std::vector<std::string>;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto first = std::make_unique<fakes::ScriptedPlugin>("first", nullptr);
        first->command_list = {{"add-aws-cluster", "Create a cluster", nullptr},
                               {"add-service", "First service command", nullptr}};
        auto second = std::make_unique<fakes::ScriptedPlugin>("second", nullptr);
        second->command_list = {{"add-service", "Second service command", nullptr}};

        std::vector<Box<Plugin>> plugins;
        plugins.push_back(std::move(first));
        plugins.push_back(std::move(second));
        registry = std::make_unique<PluginRegistry>(std::move(plugins));
        router = std::make_unique<CommandRouter>(*registry);
    }

    Box<PluginRegistry> registry;
    Box<CommandRouter> router;
};

// ============================================================================
// Help
// ============================================================================

TEST_F(RouterTest, EmptyArgsShowHelp) {
    EXPECT_EQ(router->route({}).kind, RouteKind::Help);
}

TEST_F(RouterTest, AnyArgContainingHelpShowsHelp) {
    EXPECT_EQ(router->route({"-help"}).kind, RouteKind::Help);
    EXPECT_EQ(router->route({"--help"}).kind, RouteKind::Help);
    EXPECT_EQ(router->route({"plan", "-help"}).kind, RouteKind::Help);
    EXPECT_EQ(router->route({"add-aws-cluster", "-cluster_name=helpdesk"}).kind, RouteKind::Help);
}

TEST_F(RouterTest, OnlyFlagsShowHelp) {
    EXPECT_EQ(router->route({"-version", "-no-color"}).kind, RouteKind::Help);
}

TEST_F(RouterTest, UnknownCommandShowsHelp) {
    EXPECT_EQ(router->route({"frobnicate"}).kind, RouteKind::Help);
}

// ============================================================================
// Plugin Commands
// ============================================================================

TEST_F(RouterTest, PluginCommandGetsArgsAfterToken) {
    auto route = router->route({"add-aws-cluster", "-num_masters=3", "-cluster_name", "prod"});

    ASSERT_EQ(route.kind, RouteKind::Plugin);
    ASSERT_NE(route.command, nullptr);
    EXPECT_EQ(route.command->command.name, "add-aws-cluster");
    EXPECT_EQ(route.args, (Args{"-num_masters=3", "-cluster_name", "prod"}));
}

TEST_F(RouterTest, LeadingFlagsAreDroppedForPluginCommands) {
    auto route = router->route({"-no-color", "add-service", "kafka"});

    ASSERT_EQ(route.kind, RouteKind::Plugin);
    EXPECT_EQ(route.args, (Args{"kafka"}));
}

TEST_F(RouterTest, FirstRegisteredCommandWins) {
    auto route = router->route({"add-service", "kafka"});

    ASSERT_EQ(route.kind, RouteKind::Plugin);
    EXPECT_EQ(route.command->owner->name(), "first");
    EXPECT_EQ(route.command->command.description, "First service command");
}

TEST(RegistryTest, KeepsShadowedCommandsInListing) {
    auto first = std::make_unique<fakes::ScriptedPlugin>("first", nullptr);
    first->command_list = {{"dup", "one", nullptr}};
    auto second = std::make_unique<fakes::ScriptedPlugin>("second", nullptr);
    second->command_list = {{"dup", "two", nullptr}, {"solo", "three", nullptr}};

    std::vector<Box<Plugin>> plugins;
    plugins.push_back(std::move(first));
    plugins.push_back(std::move(second));
    PluginRegistry registry(std::move(plugins));

    ASSERT_EQ(registry.commands().size(), 3u);
    EXPECT_EQ(registry.find_command("dup")->command.description, "one");
    EXPECT_EQ(registry.find_command("solo")->owner->name(), "second");
    EXPECT_EQ(registry.find_command("missing"), nullptr);
}

// ============================================================================
// Passthrough
// ============================================================================

TEST_F(RouterTest, TerraformCommandPassesFullVector) {
    auto route = router->route({"-chdir=infra", "plan", "-out=tfplan"});

    ASSERT_EQ(route.kind, RouteKind::Passthrough);
    EXPECT_EQ(route.command, nullptr);
    EXPECT_EQ(route.args, (Args{"-chdir=infra", "plan", "-out=tfplan"}));
}

TEST_F(RouterTest, OnlyFirstNonFlagTokenDecides) {
    // "apply" is a terraform command but "kafka" comes first
    EXPECT_EQ(router->route({"kafka", "apply"}).kind, RouteKind::Help);
    EXPECT_EQ(router->route({"apply", "add-service"}).kind, RouteKind::Passthrough);
}

TEST(IsPassthroughTest, KnownCommands) {
    for (const char* cmd : {"init", "plan", "apply", "destroy", "state", "workspace", "0.12checklist"}) {
        EXPECT_TRUE(CommandRouter::is_passthrough(cmd)) << cmd;
    }
    EXPECT_FALSE(CommandRouter::is_passthrough("add-aws-cluster"));
    EXPECT_FALSE(CommandRouter::is_passthrough("Plan"));
    EXPECT_FALSE(CommandRouter::is_passthrough(""));
}
