#include <dv_alm/workflow/export_workflow.hpp>

#include <dv_alm/core/file_io.hpp>
#include <dv_alm/core/log.hpp>
#include <dv_alm/dataverse/solutions.hpp>
#include <dv_alm/solution/solution_manifest.hpp>
#include <dv_alm/solution/version_bumper.hpp>

#include <filesystem>
#include <initializer_list>
#include <sstream>

namespace dv_alm {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

ExportWorkflow::ExportWorkflow(IDataverseSession& session,
                               ISolutionPackager& packager,
                               const IComponentComparer& comparer,
                               IGitClient& git,
                               HookRunner& hooks,
                               const AlmConfig& config)
    : session_(session), packager_(packager), comparer_(comparer),
      git_(git), hooks_(hooks), config_(config) {}

ExportHookContext ExportWorkflow::HookContext(
    const std::vector<std::string>& changed) const {
    ExportHookContext context;
    context.environment = config_.export_environment;
    if (const auto* env = config_.FindEnvironment(config_.export_environment)) {
        context.environment_url = env->url;
    }
    context.commit_message = config_.commit_message;
    for (const auto& solution : config_.solutions) {
        context.solutions.push_back(solution.name);
    }
    context.changed_solutions = changed;
    return context;
}

Result<RunResult, Error> ExportWorkflow::Execute() {
    auto total_start = Clock::now();
    RunResult result;
    result.command = "export";

    auto pre = hooks_.Run(HookPhase::PreExport, HookContext({}));
    if (pre.IsErr()) {
        return Result<RunResult, Error>::Err(std::move(pre).Error());
    }

    std::vector<std::string> changed;
    for (const auto& solution : config_.solutions) {
        ScopedLogGroup group("export " + solution.name);
        auto exported = ExportOne(solution);
        if (exported.IsErr()) {
            return Result<RunResult, Error>::Err(std::move(exported).Error());
        }
        auto solution_result = std::move(exported).Value();
        if (solution_result.success && solution_result.action == "changed") {
            changed.push_back(solution.name);
        }
        result.solutions.push_back(std::move(solution_result));
    }

    if (!changed.empty()) {
        auto committed = git_.Commit(config_.commit_message);
        if (committed.IsErr()) {
            return Result<RunResult, Error>::Err(std::move(committed).Error());
        }
        if (config_.git.push) {
            auto pushed = git_.Push(config_.git.remote, config_.git.branch);
            if (pushed.IsErr()) {
                return Result<RunResult, Error>::Err(std::move(pushed).Error());
            }
        }
    } else {
        LogInfo("export", "no solution changed; nothing to commit");
    }

    auto post = hooks_.Run(HookPhase::PostExport, HookContext(changed));
    if (post.IsErr()) {
        return Result<RunResult, Error>::Err(std::move(post).Error());
    }

    int failed = 0;
    for (const auto& s : result.solutions) {
        if (!s.success) ++failed;
    }
    result.success = failed == 0;
    result.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    oss << changed.size() << " changed, "
        << (result.solutions.size() - changed.size() - static_cast<size_t>(failed))
        << " unchanged, " << failed << " failed";
    result.summary = oss.str();
    return Result<RunResult, Error>::Ok(std::move(result));
}

Result<SolutionRunResult, Error> ExportWorkflow::ExportOne(const SolutionConfig& solution) {
    using R = Result<SolutionRunResult, Error>;
    namespace fs = std::filesystem;

    auto start = Clock::now();
    SolutionRunResult result;
    result.solution_name = solution.name;

    const fs::path staging_root(config_.paths.staging);
    const auto unmanaged_zip = staging_root / (solution.name + ".zip");
    const auto staged_folder = staging_root / solution.name;
    const auto source_folder = fs::path(config_.paths.source) / solution.name;

    // Export both flavours; unpack --packagetype Both reads X.zip + X_managed.zip.
    auto step_start = Clock::now();
    for (bool managed : {false, true}) {
        auto zip = ExportSolution(session_, solution.name, managed);
        if (zip.IsErr()) {
            return R::Err(std::move(zip).Error());
        }
        auto path = managed ? ManagedZipPath(unmanaged_zip) : unmanaged_zip;
        auto written = WriteBinaryFile(path, zip.Value(), ErrorCategory::Export);
        if (written.IsErr()) {
            return R::Err(std::move(written).Error());
        }
    }
    result.steps.push_back(StepResult{"export", StepOutcome::Completed,
                                      "managed and unmanaged exported", Elapsed(step_start)});

    step_start = Clock::now();
    std::error_code ec;
    fs::remove_all(staged_folder, ec);
    auto unpacked = packager_.Unpack(unmanaged_zip, staged_folder, PackageType::Both);
    if (unpacked.IsErr()) {
        return R::Err(std::move(unpacked).Error());
    }
    result.steps.push_back(StepResult{"unpack", StepOutcome::Completed,
                                      staged_folder.string(), Elapsed(step_start)});

    // Classify before the source folder is overwritten.
    step_start = Clock::now();
    std::optional<SolutionSnapshot> old_snapshot;
    if (fs::exists(source_folder, ec)) {
        old_snapshot = SolutionSnapshot{source_folder};
    }
    auto classification = ClassifyChange(comparer_, old_snapshot,
                                          SolutionSnapshot{staged_folder});
    if (classification.IsErr()) {
        auto err = std::move(classification).Error();
        LogError("export", solution.name + ": " + err.ToString());
        result.steps.push_back(StepResult{"classify", StepOutcome::Failed,
                                          err.ToString(), Elapsed(step_start)});
        result.success = false;
        result.action = "failed";
        result.message = "comparison failed: " + err.message;
        result.error = std::move(err);
        result.elapsed = Elapsed(start);
        return R::Ok(std::move(result));
    }
    const auto kind = classification.Value();
    result.steps.push_back(StepResult{"classify", StepOutcome::Completed,
                                      ClassificationName(kind), Elapsed(step_start)});

    auto replaced = ReplaceDirectory(staged_folder, source_folder, ErrorCategory::Export);
    if (replaced.IsErr()) {
        return R::Err(std::move(replaced).Error());
    }

    auto has_changes = git_.HasChanges(source_folder.string());
    if (has_changes.IsErr()) {
        return R::Err(std::move(has_changes).Error());
    }

    auto manifest = ReadSolutionManifest(source_folder);
    if (manifest.IsErr()) {
        return R::Err(std::move(manifest).Error());
    }
    const auto current = manifest.Value().version;
    result.from_version = current.ToString();

    if (!has_changes.Value()) {
        LogInfo("export", solution.name + " unchanged at " + current.ToString());
        result.steps.push_back(StepResult{"version", StepOutcome::Skipped,
                                          "no changes", std::chrono::milliseconds{0}});
        result.success = true;
        result.action = "unchanged";
        result.to_version = current.ToString();
        result.message = "no changes";
        result.elapsed = Elapsed(start);
        return R::Ok(std::move(result));
    }

    step_start = Clock::now();
    auto bumped = NextVersion(current, kind);
    if (bumped.IsErr()) {
        auto err = std::move(bumped).Error();
        err.target = solution.name;
        return R::Err(std::move(err));
    }
    const auto next = bumped.Value();
    auto set = SetSolutionVersion(session_, solution.name, next);
    if (set.IsErr()) {
        return R::Err(std::move(set).Error());
    }
    auto written = WriteSolutionVersion(source_folder, next);
    if (written.IsErr()) {
        return R::Err(std::move(written).Error());
    }
    result.steps.push_back(StepResult{"version", StepOutcome::Completed,
                                      current.ToString() + " -> " + next.ToString(),
                                      Elapsed(step_start)});

    auto added = git_.Add(source_folder.string());
    if (added.IsErr()) {
        return R::Err(std::move(added).Error());
    }

    LogInfo("export", solution.name + " " + ClassificationName(kind) + " change: " +
            current.ToString() + " -> " + next.ToString());
    result.success = true;
    result.action = "changed";
    result.to_version = next.ToString();
    result.message = ClassificationName(kind) + " change";
    result.elapsed = Elapsed(start);
    return R::Ok(std::move(result));
}

} // namespace dv_alm
