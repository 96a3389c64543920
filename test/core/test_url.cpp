#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/core/url.hpp>

using namespace mcp_manager;

// ===========================================================================
// ParseHttpUrl
// ===========================================================================

TEST_CASE("ParseHttpUrl: default ports per scheme", "[url]") {
    auto http = ParseHttpUrl("http://localhost/sse");
    REQUIRE(http.IsOk());
    CHECK(http.Value().scheme == "http");
    CHECK(http.Value().host == "localhost");
    CHECK(http.Value().port == 80);
    CHECK(http.Value().target == "/sse");

    auto https = ParseHttpUrl("HTTPS://example.com");
    REQUIRE(https.IsOk());
    CHECK(https.Value().scheme == "https");
    CHECK(https.Value().port == 443);
    CHECK(https.Value().target == "/");
}

TEST_CASE("ParseHttpUrl: explicit port, query kept, fragment dropped", "[url]") {
    auto r = ParseHttpUrl("http://127.0.0.1:8931/messages?sessionId=abc#frag");
    REQUIRE(r.IsOk());
    CHECK(r.Value().port == 8931);
    CHECK(r.Value().target == "/messages?sessionId=abc");
    CHECK(r.Value().Origin() == "http://127.0.0.1:8931");
}

TEST_CASE("ParseHttpUrl: query without path", "[url]") {
    auto r = ParseHttpUrl("http://h:1?x=1");
    REQUIRE(r.IsOk());
    CHECK(r.Value().target == "/?x=1");
}

TEST_CASE("ParseHttpUrl: bracketed IPv6 host and userinfo", "[url]") {
    auto v6 = ParseHttpUrl("http://[::1]:3000/sse");
    REQUIRE(v6.IsOk());
    CHECK(v6.Value().host == "::1");
    CHECK(v6.Value().port == 3000);

    auto user = ParseHttpUrl("http://user:pw@host:81/");
    REQUIRE(user.IsOk());
    CHECK(user.Value().host == "host");
    CHECK(user.Value().port == 81);
}

TEST_CASE("HttpUrl: IPv6 hosts are bracketed when formatted", "[url]") {
    auto v6 = ParseHttpUrl("http://[::1]:3000/sse").Value();
    CHECK(v6.Origin() == "http://[::1]:3000");
    CHECK(v6.ToString() == "http://[::1]:3000/sse");

    auto resolved = ResolveUrlReference("http://[::1]:3000/sse", "/messages?s=1");
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value() == "http://[::1]:3000/messages?s=1");
}

TEST_CASE("ParseHttpUrl: rejects malformed input", "[url]") {
    CHECK(ParseHttpUrl("ftp://host/").IsErr());
    CHECK(ParseHttpUrl("/relative").IsErr());
    CHECK(ParseHttpUrl("http:///nohost").IsErr());
    CHECK(ParseHttpUrl("http://host:abc/").IsErr());
    CHECK(ParseHttpUrl("http://host:70000/").IsErr());
    CHECK(ParseHttpUrl("http://[::1/").IsErr());
}

TEST_CASE("HttpUrl: ToString omits default port", "[url]") {
    CHECK(ParseHttpUrl("http://h:80/a").Value().ToString() == "http://h/a");
    CHECK(ParseHttpUrl("http://h:8080/a").Value().ToString() == "http://h:8080/a");
}

TEST_CASE("IsAbsoluteHttpUrl: scheme check is case-insensitive", "[url]") {
    CHECK(IsAbsoluteHttpUrl("http://x"));
    CHECK(IsAbsoluteHttpUrl("Https://x"));
    CHECK_FALSE(IsAbsoluteHttpUrl("/messages"));
    CHECK_FALSE(IsAbsoluteHttpUrl("ws://x"));
}

// ===========================================================================
// ResolveUrlReference
// ===========================================================================

TEST_CASE("ResolveUrlReference: absolute reference is returned as is", "[url]") {
    auto r = ResolveUrlReference("http://a/sse", "http://b:9/post");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "http://b:9/post");
}

TEST_CASE("ResolveUrlReference: root-relative path replaces the target", "[url]") {
    auto r = ResolveUrlReference("http://localhost:8000/sse?x=1", "/messages?sessionId=42");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "http://localhost:8000/messages?sessionId=42");
}

TEST_CASE("ResolveUrlReference: relative path resolves against the directory", "[url]") {
    auto r = ResolveUrlReference("http://h/mcp/sse", "messages");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "http://h/mcp/messages");
}

TEST_CASE("ResolveUrlReference: empty reference or bad base fails", "[url]") {
    CHECK(ResolveUrlReference("http://h/sse", "").IsErr());
    CHECK(ResolveUrlReference("not a url", "/x").IsErr());
}
