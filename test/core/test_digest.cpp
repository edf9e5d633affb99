#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/core/digest.hpp>

#include <set>
#include <string>

using namespace mcp_gateway;

TEST_CASE("Sha256Hex: known vectors", "[digest]") {
    CHECK(Sha256Hex("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(Sha256Hex("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Base64UrlDecode: url alphabet with and without padding", "[digest]") {
    CHECK(Base64UrlDecode("eyJzdWIiOiJ1MSJ9") == std::string(R"({"sub":"u1"})"));
    CHECK(Base64UrlDecode("YQ") == std::string("a"));
    CHECK(Base64UrlDecode("YQ==") == std::string("a"));
    CHECK(Base64UrlDecode("-_8") == std::string("\xfb\xff"));
    CHECK(Base64UrlDecode("") == std::string());
}

TEST_CASE("Base64UrlDecode: rejects foreign characters and bad lengths", "[digest]") {
    CHECK_FALSE(Base64UrlDecode("a+b/").has_value());
    CHECK_FALSE(Base64UrlDecode("abcde").has_value());
    CHECK_FALSE(Base64UrlDecode("ab!d").has_value());
}

TEST_CASE("RandomHex: length and uniqueness", "[digest]") {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto value = RandomHex(16);
        CHECK(value.size() == 32);
        CHECK(value.find_first_not_of("0123456789abcdef") == std::string::npos);
        seen.insert(value);
    }
    CHECK(seen.size() == 50);
}
