#include <catch2/catch_test_macros.hpp>

#include <dv_alm/core/result.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace dv_alm;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: ValueOr", "[result]") {
    CHECK(Result<int, std::string>::Ok(7).ValueOr(0) == 7);
    CHECK(Result<int, std::string>::Err("x").ValueOr(3) == 3);
}

TEST_CASE("Result: move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 5);
}

TEST_CASE("Result: AndThen chains on Ok and short-circuits on Err", "[result]") {
    auto half = [](int v) {
        if (v % 2 != 0) return Result<int, std::string>::Err("odd");
        return Result<int, std::string>::Ok(v / 2);
    };
    CHECK(Result<int, std::string>::Ok(8).AndThen(half).AndThen(half).Value() == 2);
    auto failed = Result<int, std::string>::Ok(6).AndThen(half).AndThen(half);
    REQUIRE(failed.IsErr());
    CHECK(failed.Error() == "odd");
}

TEST_CASE("Result: Map transforms the value", "[result]") {
    auto r = Result<int, std::string>::Ok(3).Map([](int v) { return std::to_string(v); });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "3");
    auto e = Result<int, std::string>::Err("bad").Map([](int v) { return v + 1; });
    CHECK(e.Error() == "bad");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: exit codes per category", "[result][error]") {
    Error e{"op", "", std::nullopt, "m", std::nullopt, ErrorCategory::Config};
    CHECK(e.ExitCode() == 2);
    CHECK(e.WithCategory(ErrorCategory::Version).ExitCode() == 2);
    CHECK(e.WithCategory(ErrorCategory::Export).ExitCode() == 3);
    CHECK(e.WithCategory(ErrorCategory::Compare).ExitCode() == 4);
    CHECK(e.WithCategory(ErrorCategory::Import).ExitCode() == 5);
    CHECK(e.WithCategory(ErrorCategory::Identity).ExitCode() == 6);
    CHECK(e.WithCategory(ErrorCategory::Process).ExitCode() == 7);
    CHECK(e.WithCategory(ErrorCategory::Git).ExitCode() == 8);
    CHECK(e.WithCategory(ErrorCategory::Hook).ExitCode() == 9);
    CHECK(e.WithCategory(ErrorCategory::Timeout).ExitCode() == 10);
    CHECK(e.WithCategory(ErrorCategory::Internal).ExitCode() == 99);
}

TEST_CASE("Error: WithCategory keeps operation and message", "[result][error]") {
    Error e{"ExportSolution", "Contoso.Core", 500, "boom", std::nullopt,
            ErrorCategory::Internal};
    auto relabelled = e.WithCategory(ErrorCategory::Export);
    CHECK(relabelled.operation == "ExportSolution");
    CHECK(relabelled.message == "boom");
    CHECK(relabelled.category == ErrorCategory::Export);
    CHECK(e.category == ErrorCategory::Internal);
}

TEST_CASE("Error: ToString includes target, status and platform error", "[result][error]") {
    Error e{"ImportSolution", "Contoso.Core", 400, "Bad request",
            std::string("Missing dependency"), ErrorCategory::Import};
    auto text = e.ToString();
    CHECK(text == "ImportSolution [Contoso.Core] (HTTP 400): Bad request - Dataverse: Missing dependency");
}

TEST_CASE("Error: ToJson", "[result][error]") {
    Error e{"FindSystemUser", "svc@contoso.com", std::nullopt, "No system user",
            std::nullopt, ErrorCategory::Identity};
    auto json = e.ToJson();
    CHECK(json.find("\"category\":\"identity\"") != std::string::npos);
    CHECK(json.find("\"exit_code\":6") != std::string::npos);
    CHECK(json.find("http_status") == std::string::npos);
}

TEST_CASE("Error::FromHttpStatus: OData error body", "[result][error]") {
    auto e = Error::FromHttpStatus(
        "ImportSolution", "/api/data/v9.2/ImportSolution", 400,
        R"({"error":{"code":"0x80048033","message":"Solution is missing dependencies"}})");
    CHECK(e.http_status == std::optional<int>(400));
    REQUIRE(e.platform_error.has_value());
    CHECK(*e.platform_error == "Solution is missing dependencies");
    CHECK(e.message.find("Bad request") == 0);
}

TEST_CASE("Error::FromHttpStatus: status mapping", "[result][error]") {
    CHECK(Error::FromHttpStatus("op", "t", 401).category == ErrorCategory::Authentication);
    CHECK(Error::FromHttpStatus("op", "t", 404).category == ErrorCategory::NotFound);
    CHECK(Error::FromHttpStatus("op", "t", 429).category == ErrorCategory::Timeout);
    CHECK(Error::FromHttpStatus("op", "t", 503).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("op", "t", 418).category == ErrorCategory::Internal);
}

TEST_CASE("Error::FromHttpStatus: non-JSON body has no platform error", "[result][error]") {
    auto e = Error::FromHttpStatus("op", "t", 502, "<html>Bad Gateway</html>");
    CHECK_FALSE(e.platform_error.has_value());
}
