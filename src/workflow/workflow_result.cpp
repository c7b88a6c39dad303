#include <dv_alm/workflow/workflow_result.hpp>

namespace dv_alm {

std::string StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "failed";
}

int RunResult::ExitCode() const {
    if (success) {
        return 0;
    }
    for (const auto& solution : solutions) {
        if (!solution.success && solution.error.has_value()) {
            return solution.error->ExitCode();
        }
    }
    return 99;
}

} // namespace dv_alm
