#include <catch2/catch_test_macros.hpp>
#include <streamfetch/http/common/http_request.hpp>
#include <streamfetch/http/common/errors.hpp>

using namespace streamfetch;
using namespace streamfetch::http;

TEST_CASE("HTTP request URL handling", "[http_request][unit]") {

    SECTION("Components are extracted from the URL") {
        http_request request(method::GET, "https://cdn.example.com/video?id=1&sq=3");
        REQUIRE(request.get_host() == "cdn.example.com");
        REQUIRE(request.get_port() == "443");
        REQUIRE(request.is_secure());
        REQUIRE(request.get_components().target() == "/video?id=1&sq=3");
        REQUIRE(request.get_url() == "https://cdn.example.com/video?id=1&sq=3");
    }

    SECTION("Explicit port") {
        http_request request(method::HEAD, "http://127.0.0.1:8080/file");
        REQUIRE(request.get_port() == "8080");
        REQUIRE_FALSE(request.is_secure());
    }

    SECTION("Invalid URL throws invalid_url") {
        REQUIRE_THROWS_AS(http_request(method::GET, "not a url"), invalid_url);
        http_request request;
        REQUIRE_THROWS_AS(request.set_url("http://"), invalid_url);
    }
}

TEST_CASE("HTTP request serialization", "[http_request][unit]") {

    SECTION("Request line and headers") {
        http_request request(method::GET, "http://example.com/path?a=1");
        request.add_header("Host", "example.com");
        request.add_header("Range", "bytes=0-9");

        REQUIRE(request.to_string() ==
                "GET /path?a=1 HTTP/1.1\r\n"
                "Host: example.com\r\n"
                "Range: bytes=0-9\r\n"
                "\r\n");
    }

    SECTION("Content follows the headers") {
        http_request request(method::POST, "http://example.com/api");
        request.add_header("Content-Length", "2");
        request.set_content("{}");

        REQUIRE(request.to_string() ==
                "POST /api HTTP/1.1\r\n"
                "Content-Length: 2\r\n"
                "\r\n"
                "{}");
    }

    SECTION("Fragment is never sent") {
        http_request request(method::GET, "http://example.com/a#frag");
        REQUIRE(request.to_string().rfind("GET /a HTTP/1.1\r\n", 0) == 0);
    }
}

TEST_CASE("HTTP method names", "[http_request][unit]") {
    REQUIRE(get_method_string(method::GET) == "GET");
    REQUIRE(get_method_string(method::HEAD) == "HEAD");
    REQUIRE(get_method_string(method::POST) == "POST");
    REQUIRE(get_method_string(method::OPTIONS) == "OPTIONS");
}
