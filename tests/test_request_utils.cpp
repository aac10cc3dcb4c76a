#include <catch2/catch.hpp>

#include "core/Crypto.hpp"
#include "core/Request.hpp"
#include "helpers/RequestUtils.hpp"

static CHeaders headersWith(std::initializer_list<std::pair<std::string, std::string>> list) {
    CHeaders headers;
    for (const auto& [name, value] : list) {
        headers.add(name, value);
    }
    return headers;
}

// ============================================================================
// CHeaders
// ============================================================================

TEST_CASE("header lookup ignores case", "[headers]") {
    const auto HEADERS = headersWith({{"Content-Type", "application/json"}});
    CHECK(HEADERS.has("content-type"));
    CHECK(HEADERS.get("CONTENT-TYPE").value() == "application/json");
    CHECK_FALSE(HEADERS.get("Content-Length").has_value());
}

TEST_CASE("headers keep every value in order", "[headers]") {
    const auto HEADERS = headersWith({{"X-Forwarded-For", "1.1.1.1"}, {"x-forwarded-for", "2.2.2.2"}});
    const auto ALL     = HEADERS.getAll("X-FORWARDED-FOR");
    REQUIRE(ALL.size() == 2);
    CHECK(ALL[0] == "1.1.1.1");
    CHECK(ALL[1] == "2.2.2.2");
    CHECK(HEADERS.size() == 2);
}

// ============================================================================
// ipForRequest
// ============================================================================

TEST_CASE("ipForRequest takes the first forwarded hop", "[resolver]") {
    CHECK(NRequestUtils::ipForRequest(headersWith({{"X-Forwarded-For", "1.2.3.4, 5.6.7.8"}}), "9.9.9.9") == "1.2.3.4");
    CHECK(NRequestUtils::ipForRequest(headersWith({{"x-forwarded-for", "  1.2.3.4  "}}), "9.9.9.9") == "1.2.3.4");
}

TEST_CASE("ipForRequest falls back to the peer", "[resolver]") {
    CHECK(NRequestUtils::ipForRequest(CHeaders{}, "9.9.9.9") == "9.9.9.9");
    CHECK(NRequestUtils::ipForRequest(headersWith({{"X-Forwarded-For", "   "}}), "9.9.9.9") == "9.9.9.9");
    CHECK(NRequestUtils::ipForRequest(headersWith({{"X-Forwarded-For", ""}}), "9.9.9.9") == "9.9.9.9");
}

TEST_CASE("ipForRequest uses the first non-empty header occurrence", "[resolver]") {
    const auto HEADERS = headersWith({{"X-Forwarded-For", ""}, {"X-Forwarded-For", "3.3.3.3, 4.4.4.4"}, {"X-Forwarded-For", "5.5.5.5"}});
    CHECK(NRequestUtils::ipForRequest(HEADERS, "9.9.9.9") == "3.3.3.3");
}

TEST_CASE("ipForRequest with a blank first hop cannot determine the ip", "[resolver]") {
    CHECK(NRequestUtils::ipForRequest(headersWith({{"X-Forwarded-For", " , 5.6.7.8"}}), "9.9.9.9").empty());
    CHECK(NRequestUtils::ipForRequest(CHeaders{}, "").empty());
}

TEST_CASE("ipForRequest does not validate the hop", "[resolver]") {
    CHECK(NRequestUtils::ipForRequest(headersWith({{"X-Forwarded-For", "unknown"}}), "9.9.9.9") == "unknown");
}

TEST_CASE("ipForRequest honours a custom header name", "[resolver]") {
    const auto HEADERS = headersWith({{"X-Forwarded-For", "1.1.1.1"}, {"X-Real-IP", "2.2.2.2"}});
    CHECK(NRequestUtils::ipForRequest(HEADERS, "9.9.9.9", "X-Real-IP") == "2.2.2.2");
    CHECK(NRequestUtils::ipForRequest(HEADERS, "9.9.9.9", "") == "9.9.9.9");

    SIncomingRequest req;
    req.headers = HEADERS;
    req.peer    = "9.9.9.9";
    CHECK(NRequestUtils::ipForRequest(req) == "1.1.1.1");
}

// ============================================================================
// misc
// ============================================================================

TEST_CASE("json content types", "[headers]") {
    CHECK(NRequestUtils::isJsonContentType("application/json"));
    CHECK(NRequestUtils::isJsonContentType("Application/JSON; charset=utf-8"));
    CHECK(NRequestUtils::isJsonContentType("application/vnd.api+json"));
    CHECK_FALSE(NRequestUtils::isJsonContentType("text/plain"));
    CHECK_FALSE(NRequestUtils::isJsonContentType(""));
}

TEST_CASE("trim", "[headers]") {
    CHECK(NRequestUtils::trim("  a b \t\n") == "a b");
    CHECK(NRequestUtils::trim("   ").empty());
}

TEST_CASE("sha256 and base64 known values", "[crypto]") {
    CHECK(NCrypto::sha256("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(NCrypto::sha256("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(NCrypto::base64Encode("").empty());
    CHECK(NCrypto::base64Encode("f") == "Zg==");
    CHECK(NCrypto::base64Encode("{\"event\":\"x\"}") == "eyJldmVudCI6IngifQ==");
}
