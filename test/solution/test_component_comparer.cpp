#include <catch2/catch_test_macros.hpp>

#include <dv_alm/solution/component_comparer.hpp>

#include "../mocks/scratch_dir.hpp"

#include <string>

using namespace dv_alm;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

SolutionSnapshot Snapshot(const std::string& name) {
    return SolutionSnapshot{TestDataPath("solutions/" + name)};
}

} // anonymous namespace

TEST_CASE("LoadComponents: collects root components, attributes, options, processes",
          "[solution][compare]") {
    auto set = XmlComponentComparer::LoadComponents(Snapshot("base"));
    REQUIRE(set.IsOk());
    const auto& keys = set.Value().keys;
    CHECK(keys.count("root:1:account") == 1);
    CHECK(keys.count("root:9:new_color") == 1);
    CHECK(keys.count("attribute:account.name") == 1);
    CHECK(keys.count("attribute:account.new_score") == 1);
    CHECK(keys.count("optionset:new_color") == 1);
    CHECK(keys.count("option:new_color=100000001") == 1);
    CHECK(keys.count("process:{6e1a3c2b-0000-4000-8000-000000000001}") == 1);
    CHECK(set.Value().attribute_types.at("account.new_score") == "int");
}

TEST_CASE("LoadComponents: split layout from pac unpack", "[solution][compare]") {
    auto set = XmlComponentComparer::LoadComponents(Snapshot("split"));
    REQUIRE(set.IsOk());
    const auto& keys = set.Value().keys;
    CHECK(keys.count("attribute:account.name") == 1);
    CHECK(keys.count("form:{8448b78f-8f42-454e-8e2a-f8196b0419af}") == 1);
}

TEST_CASE("LoadComponents: missing Solution.xml", "[solution][compare]") {
    dv_alm::testing::ScratchDir dir("compare_empty");
    auto set = XmlComponentComparer::LoadComponents(SolutionSnapshot{dir.path});
    REQUIRE(set.IsErr());
    CHECK(set.Error().category == ErrorCategory::Compare);
}

TEST_CASE("LoadComponents: malformed XML", "[solution][compare]") {
    auto set = XmlComponentComparer::LoadComponents(Snapshot("broken"));
    REQUIRE(set.IsErr());
    CHECK(set.Error().message.find("XML parse error") != std::string::npos);
}

TEST_CASE("IsAdditiveSuperset: identical snapshots", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("base"), Snapshot("base"));
    REQUIRE(result.IsOk());
    CHECK(result.Value());
}

TEST_CASE("IsAdditiveSuperset: new attribute and option are additive", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("base"), Snapshot("additive"));
    REQUIRE(result.IsOk());
    CHECK(result.Value());
}

TEST_CASE("IsAdditiveSuperset: removing components is breaking", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("base"), Snapshot("removed"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value());
}

TEST_CASE("IsAdditiveSuperset: retyped attribute is breaking", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("base"), Snapshot("retyped"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value());
}

TEST_CASE("IsAdditiveSuperset: the reverse of additive is breaking", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("additive"), Snapshot("base"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value());
}

TEST_CASE("IsAdditiveSuperset: unreadable snapshot is an error", "[solution][compare]") {
    XmlComponentComparer comparer;
    auto result = comparer.IsAdditiveSuperset(Snapshot("base"), Snapshot("broken"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Compare);
}
