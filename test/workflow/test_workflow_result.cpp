#include <catch2/catch_test_macros.hpp>

#include <dv_alm/workflow/workflow_result.hpp>

using namespace dv_alm;

TEST_CASE("StepOutcomeName: all outcomes", "[workflow][result]") {
    CHECK(StepOutcomeName(StepOutcome::Completed) == "completed");
    CHECK(StepOutcomeName(StepOutcome::Skipped) == "skipped");
    CHECK(StepOutcomeName(StepOutcome::Failed) == "failed");
}

TEST_CASE("RunResult: exit code", "[workflow][result]") {
    RunResult run;

    SECTION("success is zero") {
        run.success = true;
        CHECK(run.ExitCode() == 0);
    }

    SECTION("first failed solution decides") {
        SolutionRunResult ok;
        ok.success = true;
        SolutionRunResult compare;
        compare.error = Error{"CompareComponents", "Contoso.Core", std::nullopt,
                              "bad xml", std::nullopt, ErrorCategory::Compare};
        SolutionRunResult git;
        git.error = Error{"Git", "commit", std::nullopt, "failed", std::nullopt,
                          ErrorCategory::Git};
        run.solutions = {ok, compare, git};
        CHECK(run.ExitCode() == 4);
    }

    SECTION("failure without an error is internal") {
        run.solutions.push_back(SolutionRunResult{});
        CHECK(run.ExitCode() == 99);
    }
}
