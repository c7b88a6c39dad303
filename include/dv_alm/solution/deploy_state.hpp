#pragma once

#include <dv_alm/core/result.hpp>

#include <string>
#include <utility>

namespace dv_alm {

// ---------------------------------------------------------------------------
// DeployState — progress of one solution through a deploy run.
//
//   NotStaged -> Staged -> Upgraded -> ProcessesActivated -> Published
//
// Every step moves exactly one state forward. A skipped solution walks the
// same path without touching the environment.
// ---------------------------------------------------------------------------
enum class DeployState {
    NotStaged,
    Staged,
    Upgraded,
    ProcessesActivated,
    Published,
};

std::string DeployStateName(DeployState state);

// ---------------------------------------------------------------------------
// SolutionDeployment — one solution's state, with validated transitions.
// ---------------------------------------------------------------------------
class SolutionDeployment {
public:
    explicit SolutionDeployment(std::string solution_name)
        : solution_name_(std::move(solution_name)) {}

    [[nodiscard]] const std::string& SolutionName() const noexcept { return solution_name_; }
    [[nodiscard]] DeployState State() const noexcept { return state_; }

    /// Move to `next`. Err (category Internal) unless `next` directly
    /// follows the current state.
    [[nodiscard]] Result<void, Error> Advance(DeployState next);

private:
    std::string solution_name_;
    DeployState state_ = DeployState::NotStaged;
};

} // namespace dv_alm
