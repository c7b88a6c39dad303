#include <dv_alm/workflow/build_workflow.hpp>

#include <dv_alm/core/log.hpp>
#include <dv_alm/solution/solution_manifest.hpp>
#include <dv_alm/workflow/artifact_manifest.hpp>

#include <filesystem>
#include <system_error>

namespace dv_alm {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

BuildWorkflow::BuildWorkflow(ISolutionPackager& packager,
                             HookRunner& hooks,
                             const AlmConfig& config)
    : packager_(packager), hooks_(hooks), config_(config) {}

BuildHookContext BuildWorkflow::HookContext() const {
    BuildHookContext context;
    context.source_dir = config_.paths.source;
    context.artifacts_dir = config_.paths.artifacts;
    for (const auto& solution : config_.solutions) {
        context.solutions.push_back(solution.name);
    }
    return context;
}

Result<RunResult, Error> BuildWorkflow::Execute() {
    using R = Result<RunResult, Error>;
    namespace fs = std::filesystem;

    auto total_start = Clock::now();
    RunResult result;
    result.command = "build";

    auto pre = hooks_.Run(HookPhase::PreBuild, HookContext());
    if (pre.IsErr()) {
        return R::Err(std::move(pre).Error());
    }

    const fs::path artifacts_dir(config_.paths.artifacts);
    std::error_code ec;
    fs::create_directories(artifacts_dir, ec);
    if (ec) {
        return R::Err(Error{"Build", artifacts_dir.string(), std::nullopt,
                            "Cannot create artifacts folder: " + ec.message(),
                            std::nullopt, ErrorCategory::Packager});
    }

    std::vector<ArtifactEntry> entries;
    for (const auto& solution : config_.solutions) {
        ScopedLogGroup group("pack " + solution.name);
        auto start = Clock::now();
        const auto folder = fs::path(config_.paths.source) / solution.name;

        auto manifest = ReadSolutionManifest(folder);
        if (manifest.IsErr()) {
            return R::Err(std::move(manifest).Error());
        }
        const auto version = manifest.Value().version.ToString();

        const auto zip = artifacts_dir / (solution.name + ".zip");
        auto packed = packager_.Pack(folder, zip, PackageType::Both);
        if (packed.IsErr()) {
            return R::Err(std::move(packed).Error());
        }

        entries.push_back(ArtifactEntry{
            solution.name, version,
            ManagedZipPath(zip).filename().string(),
            zip.filename().string()});

        LogInfo("build", "packed " + solution.name + " " + version);
        SolutionRunResult solution_result;
        solution_result.solution_name = solution.name;
        solution_result.success = true;
        solution_result.action = "packed";
        solution_result.to_version = version;
        solution_result.message = zip.string();
        solution_result.elapsed = Elapsed(start);
        solution_result.steps.push_back(StepResult{
            "pack", StepOutcome::Completed, zip.string(), solution_result.elapsed});
        result.solutions.push_back(std::move(solution_result));
    }

    auto written = WriteArtifactManifest(artifacts_dir, entries);
    if (written.IsErr()) {
        return R::Err(std::move(written).Error());
    }

    auto post = hooks_.Run(HookPhase::PostBuild, HookContext());
    if (post.IsErr()) {
        return R::Err(std::move(post).Error());
    }

    result.success = true;
    result.total_duration = Elapsed(total_start);
    result.summary = std::to_string(entries.size()) + " solutions packed";
    return R::Ok(std::move(result));
}

} // namespace dv_alm
