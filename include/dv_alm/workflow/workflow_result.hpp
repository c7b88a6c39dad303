#pragma once

#include <dv_alm/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// StepOutcome — outcome for each step of a workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

std::string StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult — outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// SolutionRunResult — what one workflow did to one solution.
//
// `action` is workflow specific: "changed"/"unchanged" for export,
// "packed" for build, the import action for deploy.
// ---------------------------------------------------------------------------
struct SolutionRunResult {
    std::string solution_name;
    bool success = false;
    std::string action;
    std::string from_version;
    std::string to_version;
    std::string message;
    std::optional<Error> error;
    std::chrono::milliseconds elapsed{0};
    std::vector<StepResult> steps;
};

// ---------------------------------------------------------------------------
// RunResult — aggregated results from one workflow run.
// ---------------------------------------------------------------------------
struct RunResult {
    std::string command;
    bool success = false;
    std::vector<SolutionRunResult> solutions;
    std::string summary;
    std::chrono::milliseconds total_duration{0};

    /// 0 on success, otherwise the exit code of the first failed solution.
    [[nodiscard]] int ExitCode() const;
};

} // namespace dv_alm
