#include <catch2/catch_test_macros.hpp>

#include <dv_alm/core/base64.hpp>

#include <string>

using namespace dv_alm;

TEST_CASE("Base64Encode: padding", "[core][base64]") {
    CHECK(Base64Encode("") == "");
    CHECK(Base64Encode("P") == "UA==");
    CHECK(Base64Encode("PK") == "UEs=");
    CHECK(Base64Encode("PK\x03") == "UEsD");
}

TEST_CASE("Base64Decode: zip header", "[core][base64]") {
    auto decoded = Base64Decode("UEsDBBQ=");
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == std::string("PK\x03\x04\x14", 5));
}

TEST_CASE("Base64Decode: binary survives", "[core][base64]") {
    std::string binary;
    for (int i = 0; i < 256; ++i) binary.push_back(static_cast<char>(i));
    auto decoded = Base64Decode(Base64Encode(binary));
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == binary);
}

TEST_CASE("Base64Decode: rejects invalid characters", "[core][base64]") {
    CHECK(Base64Decode("UEs*").IsErr());
}

TEST_CASE("Base64Decode: rejects truncated input", "[core][base64]") {
    CHECK(Base64Decode("UEs").IsErr());
}

TEST_CASE("Base64Decode: padding only at the end", "[core][base64]") {
    CHECK(Base64Decode("UE==UEsD").IsErr());
    CHECK(Base64Decode("U=sD").IsErr());
    CHECK(Base64Decode("U===").IsErr());
    auto two = Base64Decode("UA==");
    REQUIRE(two.IsOk());
    CHECK(two.Value() == "P");
}

TEST_CASE("Base64: payloads larger than one block", "[core][base64]") {
    std::string payload;
    for (int i = 0; i < 200000; ++i) payload.push_back(static_cast<char>((i * 7) & 0xFF));
    auto encoded = Base64Encode(payload);
    CHECK(encoded.size() == (payload.size() + 2) / 3 * 4);
    auto decoded = Base64Decode(encoded);
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == payload);
}
