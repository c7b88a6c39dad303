#include <dv_alm/workflow/deploy_workflow.hpp>

#include <dv_alm/config/config_loader.hpp>
#include <dv_alm/core/file_io.hpp>
#include <dv_alm/core/log.hpp>
#include <dv_alm/dataverse/processes.hpp>
#include <dv_alm/dataverse/solutions.hpp>
#include <dv_alm/workflow/artifact_manifest.hpp>

#include <filesystem>
#include <map>
#include <sstream>

namespace dv_alm {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

DeployWorkflow::DeployWorkflow(IDataverseSession& session,
                               HookRunner& hooks,
                               const AlmConfig& config)
    : session_(session), hooks_(hooks), config_(config) {}

DeployHookContext DeployWorkflow::HookContext(const std::vector<PlannedSolution>& plan,
                                              const DeployOptions& options) const {
    DeployHookContext context;
    context.environment = config_.target_environment;
    if (const auto* env = config_.FindEnvironment(config_.target_environment)) {
        context.environment_url = env->url;
    }
    context.unmanaged = options.unmanaged;
    for (const auto& solution : config_.solutions) {
        context.solutions.push_back(solution.name);
    }
    for (const auto& item : plan) {
        if (item.deployment.State() == DeployState::NotStaged) continue;
        if (ImportsArtifact(item.decision)) {
            context.imported_solutions.push_back(item.config.name);
        }
        if (item.decision.mode == ImportMode::Holding &&
            item.deployment.State() == DeployState::Staged) {
            context.holding_solutions.push_back(item.config.name);
        }
    }
    return context;
}

Result<RunResult, Error> DeployWorkflow::Execute(const DeployOptions& options) {
    using R = Result<RunResult, Error>;

    auto total_start = Clock::now();
    RunResult result;
    result.command = "deploy";

    // Plan: every configured solution needs an artifact.
    const std::filesystem::path artifacts_dir(config_.paths.artifacts);
    auto artifacts = ReadArtifactManifest(artifacts_dir);
    if (artifacts.IsErr()) {
        return R::Err(std::move(artifacts).Error());
    }

    std::vector<PlannedSolution> plan;
    plan.reserve(config_.solutions.size());
    for (const auto& solution : config_.solutions) {
        auto entry = FindArtifact(artifacts.Value(), solution.name);
        if (!entry.has_value()) {
            return R::Err(Error{"Deploy", solution.name, std::nullopt,
                                "No artifact for solution in " +
                                    (artifacts_dir / kArtifactManifestFile).string(),
                                std::nullopt, ErrorCategory::Config});
        }
        auto version = SolutionVersion::Parse(entry->version);
        if (version.IsErr()) {
            auto err = std::move(version).Error();
            err.target = solution.name;
            return R::Err(std::move(err));
        }
        const bool unmanaged = options.unmanaged || solution.deploy_unmanaged;
        plan.push_back(PlannedSolution{
            solution,
            (artifacts_dir / (unmanaged ? entry->unmanaged_file : entry->managed_file)).string(),
            version.Value(),
            std::nullopt,
            ImportDecision{},
            SolutionDeployment(solution.name),
            SolutionRunResult{}});
        plan.back().result.solution_name = solution.name;
        plan.back().result.to_version = entry->version;
    }

    auto pre = hooks_.Run(HookPhase::PreDeploy, HookContext(plan, options));
    if (pre.IsErr()) {
        return R::Err(std::move(pre).Error());
    }

    auto staged = StageAll(plan, options);
    if (staged.IsErr()) {
        return R::Err(std::move(staged).Error());
    }

    auto migrate = hooks_.Run(HookPhase::PreUpgrade, HookContext(plan, options));
    if (migrate.IsErr()) {
        return R::Err(std::move(migrate).Error());
    }

    auto upgraded = UpgradeAll(plan);
    if (upgraded.IsErr()) {
        return R::Err(std::move(upgraded).Error());
    }

    auto activated = ActivateProcesses(plan);
    if (activated.IsErr()) {
        return R::Err(std::move(activated).Error());
    }

    auto published = PublishAll(plan);
    if (published.IsErr()) {
        return R::Err(std::move(published).Error());
    }

    auto post = hooks_.Run(HookPhase::PostDeploy, HookContext(plan, options));
    if (post.IsErr()) {
        return R::Err(std::move(post).Error());
    }

    int imported = 0;
    for (auto& item : plan) {
        if (ImportsArtifact(item.decision)) ++imported;
        item.result.success = true;
        item.result.message = DeployStateName(item.deployment.State());
        result.solutions.push_back(std::move(item.result));
    }

    result.success = true;
    result.total_duration = Elapsed(total_start);
    std::ostringstream oss;
    oss << imported << " imported, " << (plan.size() - static_cast<size_t>(imported))
        << " skipped";
    result.summary = oss.str();
    return R::Ok(std::move(result));
}

Result<void, Error> DeployWorkflow::StageAll(std::vector<PlannedSolution>& plan,
                                             const DeployOptions& options) {
    const int batch = static_cast<int>(plan.size());

    for (auto& item : plan) {
        auto start = Clock::now();
        const auto& name = item.config.name;
        ScopedLogGroup group("stage " + name);

        auto installed = GetInstalledSolution(session_, name);
        if (installed.IsErr()) {
            return Result<void, Error>::Err(std::move(installed).Error());
        }
        if (installed.Value().has_value()) {
            item.installed_version = installed.Value()->installed_version;
            item.result.from_version = item.installed_version->ToString();
        }

        ImportStrategyInput input;
        input.artifact_version = item.artifact_version;
        input.installed_version = item.installed_version;
        input.unmanaged_target = options.unmanaged || item.config.deploy_unmanaged;
        input.total_solutions_in_batch = batch;
        item.decision = SelectImportStrategy(input);
        item.result.action = ImportActionName(item.decision.action);

        const auto decision_text = ImportActionName(item.decision.action) + "/" +
                                   ImportModeName(item.decision.mode);
        if (!ImportsArtifact(item.decision)) {
            LogInfo("deploy", name + " already at " + item.artifact_version.ToString() +
                    "; skipping");
            item.result.steps.push_back(StepResult{"stage", StepOutcome::Skipped,
                                                   decision_text, Elapsed(start)});
        } else {
            LogInfo("deploy", name + ": " + decision_text + " " +
                    item.result.from_version + " -> " + item.artifact_version.ToString());
            auto zip = ReadBinaryFile(item.artifact_file, ErrorCategory::Import);
            if (zip.IsErr()) {
                return Result<void, Error>::Err(std::move(zip).Error());
            }
            auto stage = StageSolution(session_, zip.Value(), item.decision.mode);
            if (stage.IsErr()) {
                auto err = std::move(stage).Error();
                if (err.target.empty()) err.target = name;
                LogError("deploy", name + " staging failed; remaining solutions not attempted");
                return Result<void, Error>::Err(std::move(err));
            }
            item.result.steps.push_back(StepResult{"stage", StepOutcome::Completed,
                                                   decision_text, Elapsed(start)});
        }

        auto advanced = item.deployment.Advance(DeployState::Staged);
        if (advanced.IsErr()) return advanced;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> DeployWorkflow::UpgradeAll(std::vector<PlannedSolution>& plan) {
    ScopedLogGroup group("promote holding solutions");
    // Most dependent first: upstream solutions keep their old components
    // until everything that references them has been upgraded.
    for (auto it = plan.rbegin(); it != plan.rend(); ++it) {
        auto start = Clock::now();
        if (it->decision.mode == ImportMode::Holding) {
            auto promoted = DeleteAndPromote(session_, it->config.name);
            if (promoted.IsErr()) {
                return promoted;
            }
            it->result.steps.push_back(StepResult{"upgrade", StepOutcome::Completed,
                                                  "holding solution promoted", Elapsed(start)});
        } else {
            it->result.steps.push_back(StepResult{"upgrade", StepOutcome::Skipped,
                                                  "nothing to promote",
                                                  std::chrono::milliseconds{0}});
        }
        auto advanced = it->deployment.Advance(DeployState::Upgraded);
        if (advanced.IsErr()) return advanced;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> DeployWorkflow::ActivateProcesses(std::vector<PlannedSolution>& plan) {
    const auto* env = config_.FindEnvironment(config_.target_environment);
    const EnvironmentConfig empty_env;

    // Resolve every identity before the first ownership change.
    std::map<std::string, std::string> user_ids;  // upn -> systemuserid
    std::map<std::string, std::string> owner_of;  // solution -> systemuserid
    for (const auto& item : plan) {
        if (!ImportsArtifact(item.decision)) continue;
        const auto& key = item.config.service_account_key;
        auto upn = ResolveVariable(env ? *env : empty_env, key);
        if (!upn.has_value()) {
            return Result<void, Error>::Err(Error{
                "ResolveServiceAccount", item.config.name, std::nullopt,
                "Variable '" + key + "' is not set for environment '" +
                    config_.target_environment + "'",
                std::nullopt, ErrorCategory::Identity});
        }
        auto cached = user_ids.find(*upn);
        if (cached == user_ids.end()) {
            auto user = FindSystemUser(session_, *upn);
            if (user.IsErr()) {
                return Result<void, Error>::Err(std::move(user).Error());
            }
            cached = user_ids.emplace(*upn, user.Value()).first;
        }
        owner_of[item.config.name] = cached->second;
    }

    for (auto& item : plan) {
        auto start = Clock::now();
        if (!ImportsArtifact(item.decision)) {
            item.result.steps.push_back(StepResult{"processes", StepOutcome::Skipped,
                                                   "solution skipped",
                                                   std::chrono::milliseconds{0}});
            auto advanced = item.deployment.Advance(DeployState::ProcessesActivated);
            if (advanced.IsErr()) return advanced;
            continue;
        }

        const auto& name = item.config.name;
        const auto& owner = owner_of[name];
        ScopedLogGroup group("processes " + name);

        auto installed = GetInstalledSolution(session_, name);
        if (installed.IsErr()) {
            return Result<void, Error>::Err(std::move(installed).Error());
        }
        if (!installed.Value().has_value()) {
            return Result<void, Error>::Err(Error{
                "ActivateProcesses", name, std::nullopt,
                "Solution not found after import", std::nullopt,
                ErrorCategory::Import});
        }

        auto processes = ListSolutionProcesses(session_, installed.Value()->solution_id);
        if (processes.IsErr()) {
            return Result<void, Error>::Err(std::move(processes).Error());
        }

        int changed = 0;
        for (const auto& process : processes.Value()) {
            if (process.owner_id == owner && process.IsActivated()) {
                LogInfo("deploy", "process '" + process.name + "' already owned and active");
                continue;
            }
            if (process.owner_id != owner) {
                // Activated processes cannot change owner.
                if (process.IsActivated()) {
                    auto draft = SetProcessState(session_, process.id, ProcessState::Draft);
                    if (draft.IsErr()) return draft;
                }
                auto assigned = AssignOwner(session_, process.id, owner);
                if (assigned.IsErr()) return assigned;
            }
            auto activated = SetProcessState(session_, process.id, ProcessState::Activated);
            if (activated.IsErr()) return activated;
            ++changed;
        }

        item.result.steps.push_back(StepResult{
            "processes", changed > 0 ? StepOutcome::Completed : StepOutcome::Skipped,
            std::to_string(changed) + "/" + std::to_string(processes.Value().size()) +
                " processes reassigned or activated",
            Elapsed(start)});
        auto advanced = item.deployment.Advance(DeployState::ProcessesActivated);
        if (advanced.IsErr()) return advanced;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> DeployWorkflow::PublishAll(std::vector<PlannedSolution>& plan) {
    bool any_imported = false;
    for (const auto& item : plan) {
        if (ImportsArtifact(item.decision)) any_imported = true;
    }
    if (any_imported) {
        auto published = PublishAllCustomizations(session_);
        if (published.IsErr()) {
            return published;
        }
    } else {
        LogInfo("deploy", "nothing imported; skipping publish");
    }
    for (auto& item : plan) {
        auto advanced = item.deployment.Advance(DeployState::Published);
        if (advanced.IsErr()) return advanced;
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ImportWorkflow
// ---------------------------------------------------------------------------
Result<RunResult, Error> ImportWorkflow::Execute() {
    auto built = build_.Execute();
    if (built.IsErr()) {
        return built;
    }
    auto deployed = deploy_.Execute(DeployOptions{true});
    if (deployed.IsErr()) {
        return deployed;
    }
    auto result = std::move(deployed).Value();
    result.command = "import";
    result.total_duration += built.Value().total_duration;
    result.summary = built.Value().summary + "; " + result.summary;
    return Result<RunResult, Error>::Ok(std::move(result));
}

} // namespace dv_alm
