#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// SolutionConfig — one entry of the ordered solution list. List order is
// dependency order: upstream solutions first.
// ---------------------------------------------------------------------------
struct SolutionConfig {
    std::string name;
    bool deploy_unmanaged = false;
    std::string service_account_key = "ServiceAccountUpn";
};

struct EnvironmentConfig {
    std::string name;
    std::string url;                                // https://org.crm.dynamics.com
    std::string token_env;                          // env var holding the bearer token
    std::map<std::string, std::string> variables;
};

// ---------------------------------------------------------------------------
// DependencySpec — version specifier for a required external tool.
//   ""           -> Latest
//   "prerelease" -> Prerelease
//   anything else-> Exact
// ---------------------------------------------------------------------------
struct DependencySpec {
    enum class Kind { Exact, Latest, Prerelease };

    Kind kind = Kind::Latest;
    std::string version;

    static DependencySpec FromString(const std::string& text);
    [[nodiscard]] std::string ToString() const;
};

enum class HookPhase {
    PreExport,
    PostExport,
    PreBuild,
    PostBuild,
    PreDeploy,
    PreUpgrade,
    PostDeploy,
};

/// YAML key of a phase ("pre_export", ...).
std::string HookPhaseKey(HookPhase phase);
std::optional<HookPhase> HookPhaseFromKey(const std::string& key);
const std::vector<HookPhase>& AllHookPhases();

struct PathsConfig {
    std::string source = "src/solutions";
    std::string artifacts = "out/artifacts";
    std::string staging = "out/staging";
};

struct GitConfig {
    bool push = false;
    std::string remote = "origin";
    std::string branch;  // empty: current branch
};

// ---------------------------------------------------------------------------
// ConfigLayer — one YAML file or the CLI, before merging. Every scalar is
// optional so "not set in this layer" is distinguishable from a default.
// ---------------------------------------------------------------------------
struct ConfigLayer {
    std::string origin;  // file path or "cli"

    std::optional<std::vector<SolutionConfig>> solutions;
    std::map<std::string, DependencySpec> dependencies;
    std::map<HookPhase, std::vector<std::string>> hooks;
    std::map<std::string, EnvironmentConfig> environments;

    std::optional<std::string> export_environment;
    std::optional<std::string> target_environment;
    std::optional<std::string> commit_message;
    std::optional<bool> unmanaged;

    std::optional<std::string> source_path;
    std::optional<std::string> artifacts_path;
    std::optional<std::string> staging_path;

    std::optional<bool> git_push;
    std::optional<std::string> git_remote;
    std::optional<std::string> git_branch;

    std::optional<std::string> packager_program;
    std::optional<std::string> git_program;

    std::optional<std::string> log_file;
    std::optional<bool> json_output;
    std::optional<int> verbosity;
    std::optional<bool> quiet;
    std::optional<bool> no_color;
    std::optional<int> timeout_seconds;
};

// ---------------------------------------------------------------------------
// AlmConfig — the merged, immutable configuration of one run.
// ---------------------------------------------------------------------------
struct AlmConfig {
    std::vector<SolutionConfig> solutions;
    std::map<std::string, DependencySpec> dependencies;
    std::map<HookPhase, std::vector<std::string>> hooks;
    std::map<std::string, EnvironmentConfig> environments;

    std::string export_environment;
    std::string target_environment;
    std::string commit_message;
    bool unmanaged = false;

    PathsConfig paths;
    GitConfig git;

    std::string packager_program = "pac";
    std::string git_program = "git";

    std::optional<std::string> log_file;
    bool json_output = false;
    int verbosity = 0;
    bool quiet = false;
    bool no_color = false;
    int timeout_seconds = 600;

    [[nodiscard]] const EnvironmentConfig* FindEnvironment(const std::string& name) const;
};

} // namespace dv_alm
