#include <catch2/catch_test_macros.hpp>

#include <dv_alm/solution/import_strategy.hpp>

using namespace dv_alm;

namespace {

ImportDecision Decide(SolutionVersion artifact, std::optional<SolutionVersion> installed,
                      bool unmanaged = false, int batch = 1) {
    return SelectImportStrategy(ImportStrategyInput{artifact, installed, unmanaged, batch});
}

} // anonymous namespace

TEST_CASE("SelectImportStrategy: not installed is a fresh install", "[solution][strategy]") {
    auto d = Decide({1, 0, 0, 0}, std::nullopt);
    CHECK(d == ImportDecision{ImportAction::Install, ImportMode::Fresh});
    // Rule 1 wins over every other input.
    CHECK(Decide({1, 0, 0, 0}, std::nullopt, true, 5) ==
          ImportDecision{ImportAction::Install, ImportMode::Fresh});
}

TEST_CASE("SelectImportStrategy: unmanaged target always overwrites", "[solution][strategy]") {
    CHECK(Decide({1, 0, 0, 0}, SolutionVersion(1, 0, 0, 0), true) ==
          ImportDecision{ImportAction::Update, ImportMode::UnmanagedOverwrite});
    CHECK(Decide({2, 0, 0, 0}, SolutionVersion(1, 0, 0, 0), true, 3) ==
          ImportDecision{ImportAction::Update, ImportMode::UnmanagedOverwrite});
}

TEST_CASE("SelectImportStrategy: same version is skipped", "[solution][strategy]") {
    auto d = Decide({1, 0, 0, 4}, SolutionVersion(1, 0, 0, 4), false, 3);
    CHECK(d == ImportDecision{ImportAction::Skip, ImportMode::None});
    CHECK_FALSE(ImportsArtifact(d));
}

TEST_CASE("SelectImportStrategy: same major.minor updates in place", "[solution][strategy]") {
    CHECK(Decide({1, 0, 0, 4}, SolutionVersion(1, 0, 0, 3)) ==
          ImportDecision{ImportAction::Update, ImportMode::InPlace});
    CHECK(Decide({1, 0, 2, 0}, SolutionVersion(1, 0, 0, 9), false, 4) ==
          ImportDecision{ImportAction::Update, ImportMode::InPlace});
}

TEST_CASE("SelectImportStrategy: minor change in a batch stages a holding solution",
          "[solution][strategy]") {
    CHECK(Decide({1, 1, 0, 0}, SolutionVersion(1, 0, 0, 3), false, 3) ==
          ImportDecision{ImportAction::Upgrade, ImportMode::Holding});
}

TEST_CASE("SelectImportStrategy: minor change alone upgrades directly", "[solution][strategy]") {
    CHECK(Decide({1, 1, 0, 0}, SolutionVersion(1, 0, 0, 3), false, 1) ==
          ImportDecision{ImportAction::Upgrade, ImportMode::Direct});
    CHECK(Decide({2, 0, 0, 0}, SolutionVersion(1, 5, 0, 0)) ==
          ImportDecision{ImportAction::Upgrade, ImportMode::Direct});
}

TEST_CASE("SelectImportStrategy: action and mode always agree", "[solution][strategy]") {
    const std::optional<SolutionVersion> installed[] = {
        std::nullopt, SolutionVersion(1, 0, 0, 0), SolutionVersion(1, 0, 0, 1),
        SolutionVersion(1, 1, 0, 0), SolutionVersion(2, 0, 0, 0)};
    for (const auto& inst : installed) {
        for (bool unmanaged : {false, true}) {
            for (int batch : {1, 2, 5}) {
                auto d = Decide({1, 0, 0, 1}, inst, unmanaged, batch);
                switch (d.action) {
                    case ImportAction::Skip:
                        CHECK(d.mode == ImportMode::None);
                        break;
                    case ImportAction::Install:
                        CHECK(d.mode == ImportMode::Fresh);
                        break;
                    case ImportAction::Update:
                        CHECK((d.mode == ImportMode::UnmanagedOverwrite ||
                               d.mode == ImportMode::InPlace));
                        break;
                    case ImportAction::Upgrade:
                        CHECK((d.mode == ImportMode::Holding || d.mode == ImportMode::Direct));
                        break;
                }
            }
        }
    }
}

TEST_CASE("ImportActionName / ImportModeName", "[solution][strategy]") {
    CHECK(ImportActionName(ImportAction::Upgrade) == "upgrade");
    CHECK(ImportModeName(ImportMode::UnmanagedOverwrite) == "unmanaged-overwrite");
    CHECK(ImportModeName(ImportMode::InPlace) == "in-place");
}

// ===========================================================================
// End-to-end decisions
// ===========================================================================

TEST_CASE("SelectImportStrategy: re-running after an import skips", "[solution][strategy]") {
    const SolutionVersion artifact(1, 3, 0, 0);
    const std::optional<SolutionVersion> before[] = {
        std::nullopt, SolutionVersion(1, 2, 0, 0), SolutionVersion(1, 3, 0, 0),
        SolutionVersion(1, 0, 5, 1)};
    for (const auto& installed : before) {
        for (int batch : {1, 3}) {
            auto first = Decide(artifact, installed, false, batch);
            CHECK(ImportsArtifact(first) == (installed != artifact));
            // The environment now holds `artifact`.
            CHECK(Decide(artifact, artifact, false, batch) ==
                  ImportDecision{ImportAction::Skip, ImportMode::None});
        }
    }
}

TEST_CASE("SelectImportStrategy: scenario table", "[solution][strategy]") {
    CHECK(Decide({1, 0, 0, 0}, std::nullopt).action == ImportAction::Install);
    CHECK(Decide({1, 2, 3, 4}, SolutionVersion(1, 2, 3, 4)).action == ImportAction::Skip);
    CHECK(Decide({1, 2, 9, 9}, SolutionVersion(1, 2, 0, 0)).action == ImportAction::Update);
    CHECK(Decide({1, 3, 0, 0}, SolutionVersion(1, 2, 0, 0), false, 3) ==
          ImportDecision{ImportAction::Upgrade, ImportMode::Holding});
}
