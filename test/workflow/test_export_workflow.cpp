#include <catch2/catch_test_macros.hpp>

#include <dv_alm/solution/solution_manifest.hpp>
#include <dv_alm/workflow/export_workflow.hpp>

#include "../mocks/fake_tools.hpp"
#include "../mocks/mock_dataverse_session.hpp"
#include "../mocks/mock_process_runner.hpp"
#include "../mocks/scratch_dir.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

using namespace dv_alm;
using namespace dv_alm::testing;

namespace {

namespace fs = std::filesystem;

AlmConfig ExportConfig(const ScratchDir& dir, const std::vector<std::string>& names) {
    AlmConfig config;
    for (const auto& name : names) {
        SolutionConfig solution;
        solution.name = name;
        config.solutions.push_back(solution);
    }
    EnvironmentConfig dev;
    dev.name = "dev";
    dev.url = "https://contoso-dev.crm.dynamics.com";
    dev.token_env = "DV_ALM_DEV_TOKEN";
    config.environments["dev"] = dev;
    config.export_environment = "dev";
    config.commit_message = "Export solutions from dev";
    config.git.push = true;
    config.git.remote = "origin";
    config.git.branch = "main";
    config.paths.source = (dir.path / "src").string();
    config.paths.staging = (dir.path / "staging").string();
    config.paths.artifacts = (dir.path / "artifacts").string();
    return config;
}

std::string Installed(const std::string& id, const std::string& name,
                      const std::string& version) {
    nlohmann::json row = {{"solutionid", id}, {"uniquename", name},
                          {"version", version}, {"ismanaged", false}};
    return nlohmann::json{{"value", nlohmann::json::array({row})}}.dump();
}

// The environment: every export returns "PK", every lookup finds the solution.
void RouteEnvironment(MockDataverseSession& session,
                      const std::map<std::string, std::string>& installed) {
    int index = 0;
    for (const auto& [name, version] : installed) {
        session.RouteOk("GET", "uniquename%20eq%20%27" + name + "%27", 200,
                        Installed("sol-" + std::to_string(++index), name, version));
    }
    session.RouteOk("POST", "ExportSolution", 200, R"({"ExportSolutionFile":"UEs="})");
    session.RouteOk("PATCH", "solutions(", 204);
}

// Unpacking writes a folder carrying the environment's version.
void UnpackAs(FakePackager& packager, const std::map<std::string, std::string>& versions) {
    packager.on_unpack = [versions](const fs::path& folder) {
        auto name = folder.filename().string();
        WriteSolutionFolder(folder, name, versions.at(name));
    };
}

std::string SourceVersion(const AlmConfig& config, const std::string& name) {
    auto manifest = ReadSolutionManifest(fs::path(config.paths.source) / name);
    REQUIRE(manifest.IsOk());
    return manifest.Value().version.ToString();
}

std::vector<std::string> PatchedVersions(const MockDataverseSession& session) {
    std::vector<std::string> versions;
    for (const auto& call : session.CallsFor("PATCH", "solutions(")) {
        versions.push_back(nlohmann::json::parse(call.body)["version"].get<std::string>());
    }
    return versions;
}

} // anonymous namespace

// ===========================================================================
// Version bumps
// ===========================================================================

TEST_CASE("ExportWorkflow: additive change bumps revision, breaking bumps minor",
          "[workflow][export]") {
    ScratchDir dir("export_bump");
    auto config = ExportConfig(dir, {"Contoso.Core", "Contoso.Sales"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0.0.5");
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Sales", "Contoso.Sales", "1.0.0.5");

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.5"}, {"Contoso.Sales", "1.0.0.5"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.5"}, {"Contoso.Sales", "1.0.0.5"}});
    FakeComparer comparer;
    comparer.answers.push_back(Result<bool, Error>::Ok(true));
    comparer.answers.push_back(Result<bool, Error>::Ok(false));
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());
    const auto& run = result.Value();
    CHECK(run.success);
    CHECK(run.command == "export");
    CHECK(run.summary == "2 changed, 0 unchanged, 0 failed");

    REQUIRE(run.solutions.size() == 2);
    CHECK(run.solutions[0].action == "changed");
    CHECK(run.solutions[0].from_version == "1.0.0.5");
    CHECK(run.solutions[0].to_version == "1.0.0.6");
    CHECK(run.solutions[0].message == "additive change");
    CHECK(run.solutions[1].to_version == "1.1.0.0");
    CHECK(run.solutions[1].message == "breaking change");

    CHECK(PatchedVersions(session) == std::vector<std::string>{"1.0.0.6", "1.1.0.0"});
    CHECK(session.CallsFor("PATCH", "solutions(sol-1)").size() == 1);
    CHECK(session.CallsFor("PATCH", "solutions(sol-2)").size() == 1);
    CHECK(SourceVersion(config, "Contoso.Core") == "1.0.0.6");
    CHECK(SourceVersion(config, "Contoso.Sales") == "1.1.0.0");

    // The comparison ran against the old source and the fresh unpack.
    REQUIRE(comparer.calls.size() == 2);
    CHECK(comparer.calls[0].first == (fs::path(config.paths.source) / "Contoso.Core").string());
    CHECK(comparer.calls[0].second == (fs::path(config.paths.staging) / "Contoso.Core").string());

    CHECK(git.added.size() == 2);
    CHECK(git.commits == std::vector<std::string>{"Export solutions from dev"});
    CHECK(git.pushes == std::vector<std::string>{"origin main"});
}

TEST_CASE("ExportWorkflow: exports both packages and unpacks them together",
          "[workflow][export]") {
    ScratchDir dir("export_unpack");
    auto config = ExportConfig(dir, {"Contoso.Core"});

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.0"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.0"}});
    FakeComparer comparer;
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    REQUIRE(workflow.Execute().IsOk());

    auto exports = session.CallsFor("POST", "ExportSolution");
    REQUIRE(exports.size() == 2);
    CHECK(nlohmann::json::parse(exports[0].body) ==
          nlohmann::json({{"SolutionName", "Contoso.Core"}, {"Managed", false}}));
    CHECK(nlohmann::json::parse(exports[1].body)["Managed"] == true);

    const fs::path staging(config.paths.staging);
    CHECK(ReadText(staging / "Contoso.Core.zip") == "PK");
    CHECK(ReadText(staging / "Contoso.Core_managed.zip") == "PK");

    REQUIRE(packager.calls.size() == 1);
    CHECK(packager.calls[0].verb == "unpack");
    CHECK(packager.calls[0].zip == staging / "Contoso.Core.zip");
    CHECK(packager.calls[0].type == PackageType::Both);
}

TEST_CASE("ExportWorkflow: first export of a solution is additive", "[workflow][export]") {
    ScratchDir dir("export_first");
    auto config = ExportConfig(dir, {"Contoso.Core"});

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.0"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.0"}});
    FakeComparer comparer;
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());
    CHECK(comparer.calls.empty());
    CHECK(result.Value().solutions[0].to_version == "1.0.0.1");
    CHECK(SourceVersion(config, "Contoso.Core") == "1.0.0.1");
}

TEST_CASE("ExportWorkflow: exhausted revision is a version error", "[workflow][export]") {
    ScratchDir dir("export_exhausted");
    auto config = ExportConfig(dir, {"Contoso.Core"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core",
                        "1.0.0.2147483647");

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.2147483647"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.2147483647"}});
    FakeComparer comparer;
    comparer.answers.push_back(Result<bool, Error>::Ok(true));
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Version);
    CHECK(result.Error().ExitCode() == 2);
    CHECK(result.Error().target == "Contoso.Core");
    CHECK(session.CallsFor("PATCH", "solutions(").empty());
    CHECK(SourceVersion(config, "Contoso.Core") == "1.0.0.2147483647");
    CHECK(git.commits.empty());
}

// ===========================================================================
// Unchanged solutions
// ===========================================================================

TEST_CASE("ExportWorkflow: unchanged solution keeps its version", "[workflow][export]") {
    ScratchDir dir("export_unchanged");
    auto config = ExportConfig(dir, {"Contoso.Core"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0.0.5");

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.5"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.5"}});
    FakeComparer comparer;
    FakeGitClient git;
    git.has_changes.push_back(false);
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());
    CHECK(result.Value().success);
    CHECK(result.Value().summary == "0 changed, 1 unchanged, 0 failed");
    CHECK(result.Value().solutions[0].action == "unchanged");
    CHECK(result.Value().solutions[0].to_version == "1.0.0.5");

    CHECK(session.CallsFor("PATCH", "").empty());
    CHECK(SourceVersion(config, "Contoso.Core") == "1.0.0.5");
    CHECK(git.added.empty());
    CHECK(git.commits.empty());
    CHECK(git.pushes.empty());
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("ExportWorkflow: comparison failure fails only that solution",
          "[workflow][export]") {
    ScratchDir dir("export_compare");
    auto config = ExportConfig(dir, {"Contoso.Core", "Contoso.Sales"});
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Core", "Contoso.Core", "1.0.0.5");
    WriteSolutionFolder(fs::path(config.paths.source) / "Contoso.Sales", "Contoso.Sales", "2.0.0.0");

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.5"}, {"Contoso.Sales", "2.0.0.0"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.5"}, {"Contoso.Sales", "2.0.0.0"}});
    FakeComparer comparer;
    comparer.answers.push_back(Result<bool, Error>::Err(Error{
        "CompareComponents", "Contoso.Core", std::nullopt, "XML parse error",
        std::nullopt, ErrorCategory::Compare}));
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());
    const auto& run = result.Value();
    CHECK_FALSE(run.success);
    CHECK(run.summary == "1 changed, 0 unchanged, 1 failed");
    CHECK(run.ExitCode() == 4);

    REQUIRE(run.solutions.size() == 2);
    CHECK_FALSE(run.solutions[0].success);
    CHECK(run.solutions[0].action == "failed");
    REQUIRE(run.solutions[0].error.has_value());
    CHECK(run.solutions[0].error->category == ErrorCategory::Compare);
    CHECK(SourceVersion(config, "Contoso.Core") == "1.0.0.5");

    CHECK(run.solutions[1].success);
    CHECK(run.solutions[1].to_version == "2.0.0.1");
    CHECK(PatchedVersions(session) == std::vector<std::string>{"2.0.0.1"});
    CHECK(git.commits.size() == 1);
}

TEST_CASE("ExportWorkflow: export failure aborts without committing", "[workflow][export]") {
    ScratchDir dir("export_fail");
    auto config = ExportConfig(dir, {"Contoso.Core"});

    MockDataverseSession session;
    session.RouteOk("POST", "ExportSolution", 404);
    FakePackager packager;
    FakeComparer comparer;
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Export);
    CHECK(packager.calls.empty());
    CHECK(git.commits.empty());
}

TEST_CASE("ExportWorkflow: unpack failure aborts the run", "[workflow][export]") {
    ScratchDir dir("export_unpack_fail");
    auto config = ExportConfig(dir, {"Contoso.Core"});

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.0"}});
    FakePackager packager;
    packager.fail_with = Error{"SolutionPackager", "pac", std::nullopt,
                               "pac exited with code 1", std::nullopt,
                               ErrorCategory::Packager};
    FakeComparer comparer;
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    auto result = workflow.Execute();
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 3);
    CHECK(git.commits.empty());
}

// ===========================================================================
// Git and hooks
// ===========================================================================

TEST_CASE("ExportWorkflow: push disabled only commits", "[workflow][export]") {
    ScratchDir dir("export_nopush");
    auto config = ExportConfig(dir, {"Contoso.Core"});
    config.git.push = false;

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.0"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.0"}});
    FakeComparer comparer;
    FakeGitClient git;
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    REQUIRE(workflow.Execute().IsOk());
    CHECK(git.commits.size() == 1);
    CHECK(git.pushes.empty());
}

TEST_CASE("ExportWorkflow: hooks see the changed solutions", "[workflow][export][hooks]") {
    ScratchDir dir("export_hooks");
    auto config = ExportConfig(dir, {"Contoso.Core", "Contoso.Sales"});
    config.hooks[HookPhase::PreExport] = {"./prepare.sh"};
    config.hooks[HookPhase::PostExport] = {"./notify.sh"};

    MockDataverseSession session;
    RouteEnvironment(session, {{"Contoso.Core", "1.0.0.0"}, {"Contoso.Sales", "1.0.0.0"}});
    FakePackager packager;
    UnpackAs(packager, {{"Contoso.Core", "1.0.0.0"}, {"Contoso.Sales", "1.0.0.0"}});
    FakeComparer comparer;
    FakeGitClient git;
    git.has_changes = {false, true};
    MockProcessRunner runner;
    HookRunner hooks(runner, config.hooks);

    ExportWorkflow workflow(session, packager, comparer, git, hooks, config);
    REQUIRE(workflow.Execute().IsOk());

    const auto& specs = runner.Specs();
    REQUIRE(specs.size() == 2);
    CHECK(specs[0].env.at("DV_ALM_PHASE") == "pre_export");
    CHECK(specs[0].env.at("DV_ALM_ENVIRONMENT") == "dev");
    CHECK(specs[0].env.at("DV_ALM_CHANGED_SOLUTIONS").empty());
    CHECK(specs[1].env.at("DV_ALM_PHASE") == "post_export");
    CHECK(specs[1].env.at("DV_ALM_SOLUTIONS") == "Contoso.Core,Contoso.Sales");
    CHECK(specs[1].env.at("DV_ALM_CHANGED_SOLUTIONS") == "Contoso.Sales");
    CHECK(specs[1].env.at("DV_ALM_COMMIT_MESSAGE") == "Export solutions from dev");
}
