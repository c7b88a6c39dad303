#include <dv_alm/hooks/hook_registry.hpp>

#include <dv_alm/core/log.hpp>

#include <algorithm>
#include <initializer_list>

namespace dv_alm {

namespace {

std::string Join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ',';
        joined += item;
    }
    return joined;
}

bool PhaseIn(HookPhase phase, std::initializer_list<HookPhase> allowed) {
    return std::find(allowed.begin(), allowed.end(), phase) != allowed.end();
}

Error WrongContext(HookPhase phase, const char* kind) {
    return Error{"RunHooks", HookPhaseKey(phase), std::nullopt,
                 std::string("Phase does not take a ") + kind + " context",
                 std::nullopt, ErrorCategory::Internal};
}

} // anonymous namespace

std::map<std::string, std::string> HookEnvironment(const ExportHookContext& context) {
    return {
        {"DV_ALM_ENVIRONMENT", context.environment},
        {"DV_ALM_ENVIRONMENT_URL", context.environment_url},
        {"DV_ALM_COMMIT_MESSAGE", context.commit_message},
        {"DV_ALM_SOLUTIONS", Join(context.solutions)},
        {"DV_ALM_CHANGED_SOLUTIONS", Join(context.changed_solutions)},
    };
}

std::map<std::string, std::string> HookEnvironment(const BuildHookContext& context) {
    return {
        {"DV_ALM_SOURCE_DIR", context.source_dir},
        {"DV_ALM_ARTIFACTS_DIR", context.artifacts_dir},
        {"DV_ALM_SOLUTIONS", Join(context.solutions)},
    };
}

std::map<std::string, std::string> HookEnvironment(const DeployHookContext& context) {
    return {
        {"DV_ALM_ENVIRONMENT", context.environment},
        {"DV_ALM_ENVIRONMENT_URL", context.environment_url},
        {"DV_ALM_UNMANAGED", context.unmanaged ? "true" : "false"},
        {"DV_ALM_SOLUTIONS", Join(context.solutions)},
        {"DV_ALM_IMPORTED_SOLUTIONS", Join(context.imported_solutions)},
        {"DV_ALM_HOLDING_SOLUTIONS", Join(context.holding_solutions)},
    };
}

Result<void, Error> HookRunner::Run(HookPhase phase, const ExportHookContext& context) {
    if (!PhaseIn(phase, {HookPhase::PreExport, HookPhase::PostExport})) {
        return Result<void, Error>::Err(WrongContext(phase, "export"));
    }
    return RunScripts(phase, HookEnvironment(context));
}

Result<void, Error> HookRunner::Run(HookPhase phase, const BuildHookContext& context) {
    if (!PhaseIn(phase, {HookPhase::PreBuild, HookPhase::PostBuild})) {
        return Result<void, Error>::Err(WrongContext(phase, "build"));
    }
    return RunScripts(phase, HookEnvironment(context));
}

Result<void, Error> HookRunner::Run(HookPhase phase, const DeployHookContext& context) {
    if (!PhaseIn(phase, {HookPhase::PreDeploy, HookPhase::PreUpgrade,
                         HookPhase::PostDeploy})) {
        return Result<void, Error>::Err(WrongContext(phase, "deploy"));
    }
    return RunScripts(phase, HookEnvironment(context));
}

size_t HookRunner::ScriptCount(HookPhase phase) const {
    auto it = hooks_.find(phase);
    return it == hooks_.end() ? 0 : it->second.size();
}

Result<void, Error> HookRunner::RunScripts(HookPhase phase,
                                           std::map<std::string, std::string> env) {
    auto it = hooks_.find(phase);
    if (it == hooks_.end() || it->second.empty()) {
        return Result<void, Error>::Ok();
    }

    const auto phase_key = HookPhaseKey(phase);
    env["DV_ALM_PHASE"] = phase_key;

    for (const auto& script : it->second) {
        ProcessSpec spec;
        spec.program = "sh";
        spec.args = {"-c", script};
        spec.env = env;

        LogInfo("hooks", phase_key + ": " + script);
        auto result = runner_.Run(spec);
        if (result.IsErr()) {
            return Result<void, Error>::Err(
                std::move(result).Error().WithCategory(ErrorCategory::Hook));
        }
        const auto& process = result.Value();
        if (!process.out.empty()) {
            LogDebug("hooks", process.out);
        }
        if (!process.Succeeded()) {
            return Result<void, Error>::Err(Error{
                "RunHooks", phase_key + ": " + script, std::nullopt,
                "Hook exited with code " + std::to_string(process.exit_code) +
                    (process.err.empty() ? "" : ": " + process.err),
                std::nullopt, ErrorCategory::Hook});
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace dv_alm
