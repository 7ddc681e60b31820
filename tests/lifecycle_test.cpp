#include "plugin/lifecycle.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace wheels;
using namespace wheels::plugin;

using Events = std::vector<std::string>;

class LifecycleTest : public ::testing::Test {
protected:
    /// Registers a scripted plugin and returns a pointer the test can configure.
    auto add_plugin(const std::string& name) -> fakes::ScriptedPlugin* {
        auto plugin = std::make_unique<fakes::ScriptedPlugin>(name, &events);
        auto* raw = plugin.get();
        pending.push_back(std::move(plugin));
        return raw;
    }

    auto run(const std::vector<std::string>& args) -> Result<bool> {
        if (!registry) {
            registry = std::make_unique<PluginRegistry>(std::move(pending));
        }
        PluginLifecycle lifecycle(*registry, out);
        return lifecycle.run(sandbox, sandbox.tool, args);
    }

    void SetUp() override {
        sandbox.tool.events = &events;
    }

    Events events;
    std::ostringstream out;
    fakes::FakeSandbox sandbox;
    std::vector<Box<Plugin>> pending;
    Box<PluginRegistry> registry;
};

// ============================================================================
// Hook Order
// ============================================================================

TEST_F(LifecycleTest, HooksWrapTerraformInRegistrationOrder) {
    add_plugin("a");
    add_plugin("b");

    auto result = run({"plan"});
    ASSERT_TRUE(is_ok(result));

    EXPECT_EQ(events, (Events{"a:is_used", "b:is_used", "a:before_run", "b:before_run",
                              "terraform", "a:after_run", "b:after_run"}));
    EXPECT_EQ(out.str(), "Using plugin a\nUsing plugin b\n");
    ASSERT_EQ(sandbox.tool.calls.size(), 1u);
    EXPECT_EQ(sandbox.tool.calls[0], (std::vector<std::string>{"plan"}));
}

TEST_F(LifecycleTest, UnusedPluginsGetNoHooks) {
    add_plugin("a")->used = false;
    add_plugin("b");

    ASSERT_TRUE(is_ok(run({"apply"})));
    EXPECT_EQ(events, (Events{"a:is_used", "b:is_used", "b:before_run", "terraform",
                              "b:after_run"}));
    EXPECT_EQ(out.str(), "Using plugin b\n");
}

TEST_F(LifecycleTest, NoPluginsStillDelegates) {
    ASSERT_TRUE(is_ok(run({"version"})));
    EXPECT_EQ(events, (Events{"terraform"}));
    EXPECT_EQ(out.str(), "");
}

TEST_F(LifecycleTest, InitFlagFollowsArguments) {
    auto* a = add_plugin("a");

    ASSERT_TRUE(is_ok(run({"-no-color", "init"})));
    EXPECT_TRUE(a->last_is_init);

    ASSERT_TRUE(is_ok(run({"plan", "-var", "x=init"})));
    EXPECT_FALSE(a->last_is_init);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(LifecycleTest, IsUsedErrorIsFatal) {
    add_plugin("a")->is_used_error = "cannot inspect project";
    add_plugin("b");

    auto result = run({"plan"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "cannot inspect project");
    EXPECT_EQ(events, (Events{"a:is_used"}));
}

TEST_F(LifecycleTest, BeforeRunErrorStopsEverything) {
    add_plugin("a");
    add_plugin("b")->before_error = "SSH_AUTH_SOCK is not set";
    add_plugin("c");

    auto result = run({"apply"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "could not start b: SSH_AUTH_SOCK is not set");

    EXPECT_TRUE(sandbox.tool.calls.empty());
    EXPECT_EQ(events, (Events{"a:is_used", "b:is_used", "c:is_used", "a:before_run",
                              "b:before_run"}));
}

TEST_F(LifecycleTest, TerraformErrorIsPassedToAfterRun) {
    auto* a = add_plugin("a");
    auto* b = add_plugin("b");
    sandbox.tool.fail_with = "terraform exited with status 1";

    auto result = run({"apply"});
    ASSERT_TRUE(is_ok(result));

    ASSERT_TRUE(a->last_run_error.has_value());
    EXPECT_EQ(a->last_run_error->message, "terraform exited with status 1");
    ASSERT_TRUE(b->last_run_error.has_value());
    EXPECT_EQ(b->last_run_error->message, "terraform exited with status 1");
}

TEST_F(LifecycleTest, SuccessfulRunPassesNoError) {
    auto* a = add_plugin("a");
    a->last_run_error = Error("stale");

    ASSERT_TRUE(is_ok(run({"plan"})));
    EXPECT_FALSE(a->last_run_error.has_value());
}

TEST_F(LifecycleTest, AfterRunErrorIsFatal) {
    add_plugin("a")->after_error = "could not write state";
    add_plugin("b");

    auto result = run({"apply"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "could not finalize a: could not write state");
    EXPECT_EQ(events.back(), "a:after_run");
}

TEST_F(LifecycleTest, InvokeUsesGivenActiveList) {
    auto* a = add_plugin("a");
    add_plugin("b");
    registry = std::make_unique<PluginRegistry>(std::move(pending));

    PluginLifecycle lifecycle(*registry, out);
    ASSERT_TRUE(is_ok(lifecycle.invoke(sandbox, sandbox.tool, {a}, {"init"})));

    EXPECT_EQ(events, (Events{"a:before_run", "terraform", "a:after_run"}));
    EXPECT_TRUE(a->last_is_init);
}
