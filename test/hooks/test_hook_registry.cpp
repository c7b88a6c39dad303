#include <catch2/catch_test_macros.hpp>

#include <dv_alm/hooks/hook_registry.hpp>

#include "../mocks/mock_process_runner.hpp"

using namespace dv_alm;
using namespace dv_alm::testing;

TEST_CASE("HookEnvironment: deploy context", "[hooks]") {
    DeployHookContext ctx;
    ctx.environment = "test";
    ctx.environment_url = "https://contoso-test.crm.dynamics.com";
    ctx.unmanaged = false;
    ctx.solutions = {"Contoso.Core", "Contoso.Sales"};
    ctx.holding_solutions = {"Contoso.Sales"};
    auto env = HookEnvironment(ctx);
    CHECK(env.at("DV_ALM_ENVIRONMENT") == "test");
    CHECK(env.at("DV_ALM_SOLUTIONS") == "Contoso.Core,Contoso.Sales");
    CHECK(env.at("DV_ALM_HOLDING_SOLUTIONS") == "Contoso.Sales");
    CHECK(env.at("DV_ALM_IMPORTED_SOLUTIONS").empty());
    CHECK(env.at("DV_ALM_UNMANAGED") == "false");
}

TEST_CASE("HookEnvironment: export context", "[hooks]") {
    ExportHookContext ctx{"dev", "https://dev", "nightly", {"A", "B"}, {"B"}};
    auto env = HookEnvironment(ctx);
    CHECK(env.at("DV_ALM_COMMIT_MESSAGE") == "nightly");
    CHECK(env.at("DV_ALM_CHANGED_SOLUTIONS") == "B");
}

TEST_CASE("HookRunner: scripts run in order through sh", "[hooks]") {
    MockProcessRunner runner;
    HookRunner hooks(runner, {{HookPhase::PreBuild, {"./lint.sh", "echo ok"}}});
    BuildHookContext ctx{"src/solutions", "out/artifacts", {"Contoso.Core"}};

    REQUIRE(hooks.Run(HookPhase::PreBuild, ctx).IsOk());
    REQUIRE(runner.Specs().size() == 2);
    CHECK(runner.Specs()[0].program == "sh");
    CHECK(runner.Specs()[0].args == std::vector<std::string>{"-c", "./lint.sh"});
    CHECK(runner.Specs()[1].args[1] == "echo ok");
    CHECK(runner.Specs()[0].env.at("DV_ALM_PHASE") == "pre_build");
    CHECK(runner.Specs()[0].env.at("DV_ALM_ARTIFACTS_DIR") == "out/artifacts");
}

TEST_CASE("HookRunner: phase without scripts is a no-op", "[hooks]") {
    MockProcessRunner runner;
    HookRunner hooks(runner, {});
    REQUIRE(hooks.Run(HookPhase::PostBuild, BuildHookContext{}).IsOk());
    CHECK(runner.CallCount() == 0);
    CHECK(hooks.ScriptCount(HookPhase::PostBuild) == 0);
}

TEST_CASE("HookRunner: first failing script stops the phase", "[hooks]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, "", "lint failed");
    HookRunner hooks(runner, {{HookPhase::PreDeploy, {"./check.sh", "./never.sh"}}});
    auto result = hooks.Run(HookPhase::PreDeploy, DeployHookContext{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Hook);
    CHECK(result.Error().target == "pre_deploy: ./check.sh");
    CHECK(result.Error().message.find("lint failed") != std::string::npos);
    CHECK(runner.CallCount() == 1);
}

TEST_CASE("HookRunner: context kind must match the phase", "[hooks]") {
    MockProcessRunner runner;
    HookRunner hooks(runner, {{HookPhase::PreBuild, {"x"}}});
    auto result = hooks.Run(HookPhase::PreBuild, DeployHookContext{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(runner.CallCount() == 0);
}

TEST_CASE("HookRunner: real shell sees the context", "[hooks][live]") {
    PosixProcessRunner runner;
    HookRunner hooks(runner, {{HookPhase::PostExport,
                               {"test \"$DV_ALM_CHANGED_SOLUTIONS\" = \"Contoso.Core\""}}});
    ExportHookContext ctx{"dev", "https://dev", "m", {"Contoso.Core"}, {"Contoso.Core"}};
    CHECK(hooks.Run(HookPhase::PostExport, ctx).IsOk());
    ctx.changed_solutions.clear();
    CHECK(hooks.Run(HookPhase::PostExport, ctx).IsErr());
}
