#pragma once

#include <dv_alm/solution/solution_version.hpp>

#include <optional>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ImportAction / ImportMode — what the deploy workflow does with one artifact.
// ---------------------------------------------------------------------------
enum class ImportAction {
    Skip,
    Install,
    Update,
    Upgrade,
};

enum class ImportMode {
    None,                // Skip
    Fresh,               // Install into an environment without the solution
    UnmanagedOverwrite,  // Update on an unmanaged target
    InPlace,             // managed Update, same major.minor
    Holding,             // Upgrade staged as a holding solution, promoted later
    Direct,              // Upgrade applied in one stage-and-upgrade call
};

struct ImportDecision {
    ImportAction action = ImportAction::Skip;
    ImportMode mode = ImportMode::None;

    bool operator==(const ImportDecision& other) const {
        return action == other.action && mode == other.mode;
    }
    bool operator!=(const ImportDecision& other) const { return !(*this == other); }
};

struct ImportStrategyInput {
    SolutionVersion artifact_version;
    std::optional<SolutionVersion> installed_version;
    bool unmanaged_target = false;
    int total_solutions_in_batch = 1;
};

/// Decide how to import one artifact. First matching row wins:
///   1. not installed                 -> Install / Fresh
///   2. unmanaged target              -> Update  / UnmanagedOverwrite
///   3. same version                  -> Skip    / None
///   4. same major.minor              -> Update  / InPlace
///   5. different major.minor, batch  -> Upgrade / Holding
///   6. different major.minor, single -> Upgrade / Direct
[[nodiscard]] ImportDecision SelectImportStrategy(const ImportStrategyInput& input);

std::string ImportActionName(ImportAction action);
std::string ImportModeName(ImportMode mode);

/// True when the decision imports anything (everything except Skip).
[[nodiscard]] inline bool ImportsArtifact(const ImportDecision& decision) {
    return decision.action != ImportAction::Skip;
}

} // namespace dv_alm
