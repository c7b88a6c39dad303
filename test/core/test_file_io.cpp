#include <catch2/catch_test_macros.hpp>

#include <dv_alm/core/file_io.hpp>

#include "../mocks/scratch_dir.hpp"

using namespace dv_alm;
using namespace dv_alm::testing;

TEST_CASE("WriteBinaryFile: creates parent directories", "[core][file_io]") {
    ScratchDir dir("file_io_write");
    auto file = dir.path / "out" / "staging" / "Contoso.zip";
    std::string zip("PK\x03\x04\0\0", 6);
    REQUIRE(WriteBinaryFile(file, zip, ErrorCategory::Export).IsOk());

    auto read = ReadBinaryFile(file, ErrorCategory::Import);
    REQUIRE(read.IsOk());
    CHECK(read.Value() == zip);
}

TEST_CASE("ReadBinaryFile: missing file carries the category", "[core][file_io]") {
    ScratchDir dir("file_io_missing");
    auto read = ReadBinaryFile(dir.path / "nope.zip", ErrorCategory::Import);
    REQUIRE(read.IsErr());
    CHECK(read.Error().category == ErrorCategory::Import);
}

TEST_CASE("ReplaceDirectory: stale files disappear", "[core][file_io]") {
    ScratchDir dir("file_io_replace");
    WriteText(dir.path / "staging" / "Other" / "Solution.xml", "new");
    WriteText(dir.path / "source" / "Other" / "Solution.xml", "old");
    WriteText(dir.path / "source" / "Entities" / "gone.xml", "stale");

    REQUIRE(ReplaceDirectory(dir.path / "staging", dir.path / "source",
                             ErrorCategory::Export).IsOk());
    CHECK(ReadText(dir.path / "source" / "Other" / "Solution.xml") == "new");
    CHECK_FALSE(std::filesystem::exists(dir.path / "source" / "Entities"));
}

TEST_CASE("ReplaceDirectory: creates a missing target", "[core][file_io]") {
    ScratchDir dir("file_io_create");
    WriteText(dir.path / "staging" / "a.xml", "a");
    REQUIRE(ReplaceDirectory(dir.path / "staging", dir.path / "src" / "solutions" / "X",
                             ErrorCategory::Export).IsOk());
    CHECK(std::filesystem::exists(dir.path / "src" / "solutions" / "X" / "a.xml"));
}

TEST_CASE("ReplaceDirectory: failed copy leaves the target intact", "[core][file_io]") {
    ScratchDir dir("file_io_replace_fail");
    WriteText(dir.path / "source" / "Other" / "Solution.xml", "old");
    WriteText(dir.path / "source" / "Entities" / "account.xml", "kept");

    auto result = ReplaceDirectory(dir.path / "missing_staging", dir.path / "source",
                                   ErrorCategory::Export);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Export);
    CHECK(ReadText(dir.path / "source" / "Other" / "Solution.xml") == "old");
    CHECK(ReadText(dir.path / "source" / "Entities" / "account.xml") == "kept");
    CHECK_FALSE(std::filesystem::exists(dir.path / "source.incoming"));
}

TEST_CASE("ReplaceDirectory: no working folders are left behind", "[core][file_io]") {
    ScratchDir dir("file_io_replace_clean");
    WriteText(dir.path / "staging" / "a.xml", "a");
    WriteText(dir.path / "source" / "b.xml", "b");
    REQUIRE(ReplaceDirectory(dir.path / "staging", dir.path / "source",
                             ErrorCategory::Export).IsOk());
    CHECK(std::filesystem::exists(dir.path / "staging" / "a.xml"));
    CHECK_FALSE(std::filesystem::exists(dir.path / "source.incoming"));
    CHECK_FALSE(std::filesystem::exists(dir.path / "source.outgoing"));
}
