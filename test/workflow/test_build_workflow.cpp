#include <catch2/catch_test_macros.hpp>

#include <dv_alm/workflow/artifact_manifest.hpp>
#include <dv_alm/workflow/build_workflow.hpp>

#include "../mocks/fake_tools.hpp"
#include "../mocks/mock_process_runner.hpp"
#include "../mocks/scratch_dir.hpp"

#include <nlohmann/json.hpp>

using namespace dv_alm;
using namespace dv_alm::testing;

namespace {

namespace fs = std::filesystem;

AlmConfig BuildConfig(const ScratchDir& dir, const std::vector<std::string>& names) {
    AlmConfig config;
    for (const auto& name : names) {
        SolutionConfig solution;
        solution.name = name;
        config.solutions.push_back(solution);
    }
    config.paths.source = (dir.path / "src").string();
    config.paths.artifacts = (dir.path / "out" / "artifacts").string();
    return config;
}

} // anonymous namespace

// ===========================================================================
// BuildWorkflow
// ===========================================================================

TEST_CASE("BuildWorkflow: packs every solution and writes solutions.json",
          "[workflow][build]") {
    ScratchDir dir("build");
    auto config = BuildConfig(dir, {"Contoso.Core", "Contoso.Sales"});
    const fs::path source(config.paths.source);
    WriteSolutionFolder(source / "Contoso.Core", "Contoso.Core", "1.0.0.6");
    WriteSolutionFolder(source / "Contoso.Sales", "Contoso.Sales", "1.1.0.0");

    FakePackager packager;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);
    BuildWorkflow workflow(packager, hooks, config);

    auto result = workflow.Execute();
    REQUIRE(result.IsOk());
    CHECK(result.Value().success);
    CHECK(result.Value().command == "build");
    CHECK(result.Value().summary == "2 solutions packed");
    REQUIRE(result.Value().solutions.size() == 2);
    CHECK(result.Value().solutions[0].action == "packed");
    CHECK(result.Value().solutions[1].to_version == "1.1.0.0");

    const fs::path artifacts(config.paths.artifacts);
    REQUIRE(packager.calls.size() == 2);
    CHECK(packager.calls[0].verb == "pack");
    CHECK(packager.calls[0].folder == source / "Contoso.Core");
    CHECK(packager.calls[0].zip == artifacts / "Contoso.Core.zip");
    CHECK(packager.calls[0].type == PackageType::Both);
    CHECK(fs::exists(artifacts / "Contoso.Sales_managed.zip"));

    auto doc = nlohmann::json::parse(ReadText(artifacts / "solutions.json"));
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);
    CHECK(doc[0] == nlohmann::json({{"name", "Contoso.Core"},
                                    {"version", "1.0.0.6"},
                                    {"managed_file", "Contoso.Core_managed.zip"},
                                    {"unmanaged_file", "Contoso.Core.zip"}}));
    CHECK(doc[1]["name"] == "Contoso.Sales");
}

TEST_CASE("BuildWorkflow: invalid version in source aborts", "[workflow][build]") {
    ScratchDir dir("build_badversion");
    auto config = BuildConfig(dir, {"Contoso.Core"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0");

    FakePackager packager;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);
    BuildWorkflow workflow(packager, hooks, config);

    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Version);
    CHECK(packager.calls.empty());
    CHECK_FALSE(fs::exists(fs::path(config.paths.artifacts) / "solutions.json"));
}

TEST_CASE("BuildWorkflow: pack failure aborts without a manifest", "[workflow][build]") {
    ScratchDir dir("build_packfail");
    auto config = BuildConfig(dir, {"Contoso.Core"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0.0.0");

    FakePackager packager;
    packager.fail_with = Error{"SolutionPackager", "pac", std::nullopt,
                               "pac exited with code 2", std::nullopt,
                               ErrorCategory::Packager};
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);
    BuildWorkflow workflow(packager, hooks, config);

    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 3);
    CHECK_FALSE(fs::exists(fs::path(config.paths.artifacts) / "solutions.json"));
}

TEST_CASE("BuildWorkflow: hooks receive source and artifacts folders",
          "[workflow][build][hooks]") {
    ScratchDir dir("build_hooks");
    auto config = BuildConfig(dir, {"Contoso.Core"});
    config.hooks[HookPhase::PreBuild] = {"./lint.sh"};
    config.hooks[HookPhase::PostBuild] = {"./sign.sh"};
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0.0.0");

    FakePackager packager;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);
    BuildWorkflow workflow(packager, hooks, config);

    REQUIRE(workflow.Execute().IsOk());
    const auto& specs = runner.Specs();
    REQUIRE(specs.size() == 2);
    CHECK(specs[0].env.at("DV_ALM_PHASE") == "pre_build");
    CHECK(specs[0].env.at("DV_ALM_SOURCE_DIR") == config.paths.source);
    CHECK(specs[1].env.at("DV_ALM_PHASE") == "post_build");
    CHECK(specs[1].env.at("DV_ALM_ARTIFACTS_DIR") == config.paths.artifacts);
    CHECK(specs[1].env.at("DV_ALM_SOLUTIONS") == "Contoso.Core");
}

TEST_CASE("BuildWorkflow: failing pre_build hook packs nothing", "[workflow][build][hooks]") {
    ScratchDir dir("build_hookfail");
    auto config = BuildConfig(dir, {"Contoso.Core"});
    config.hooks[HookPhase::PreBuild] = {"./lint.sh"};

    FakePackager packager;
    MockProcessRunner runner;
    runner.EnqueueExit(1, "", "lint errors");
    HookRunner hooks(runner, config.hooks);
    BuildWorkflow workflow(packager, hooks, config);

    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Hook);
    CHECK(packager.calls.empty());
}
