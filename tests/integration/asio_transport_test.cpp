#include <catch2/catch_test_macros.hpp>
#include <streamfetch/http/client/asio_transport.hpp>
#include <streamfetch/http/client/client.hpp>
#include <streamfetch/http/common/errors.hpp>
#include "../fixtures/range_server_fixture.hpp"
#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace streamfetch;

TEST_CASE("Asio transport configuration", "[asio_transport][config]") {
    http::asio_transport transport;

    SECTION("Defaults") {
        REQUIRE(transport.get_timeout() == std::chrono::seconds(30));
        REQUIRE(transport.get_max_redirects() == 5);
        REQUIRE(transport.get_follow_redirects());
        REQUIRE(transport.get_verify_ssl());
    }

    SECTION("Fluent API") {
        transport.timeout(std::chrono::seconds(2)).max_redirects(1).follow_redirects(false).verify_ssl(false);
        REQUIRE(transport.get_timeout() == std::chrono::seconds(2));
        REQUIRE(transport.get_max_redirects() == 1);
        REQUIRE_FALSE(transport.get_follow_redirects());
        REQUIRE_FALSE(transport.get_verify_ssl());
    }
}

TEST_CASE("Asio transport body framing", "[asio_transport][integration]") {
    test::RangeServerFixture fixture;
    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(5));
    http::client client(transport);
    const auto payload = fixture.payload();

    SECTION("Content-Length delimited body") {
        REQUIRE(client.get(fixture.base_url + "/file") == payload);
    }

    SECTION("Chunked body") {
        REQUIRE(client.get(fixture.base_url + "/chunked") == payload);
    }

    SECTION("Body delimited by connection close") {
        REQUIRE(client.get(fixture.base_url + "/close") == payload);
    }

    SECTION("Interim responses are skipped") {
        REQUIRE(client.get(fixture.base_url + "/continue") == payload);
    }

    SECTION("Body is pulled in pieces") {
        auto response = client.execute(http::method::GET, fixture.base_url + "/file");
        REQUIRE(response->get_status_code() == 200);
        std::string received;
        while (true) {
            auto chunk = response->read(1000);
            if (chunk.empty()) break;
            REQUIRE(chunk.size() <= 1000);
            received += chunk;
        }
        REQUIRE(received == payload);
    }

    SECTION("Ranged request") {
        auto response = client.execute(http::method::GET, fixture.base_url + "/file", {{"Range", "bytes=10-19"}});
        REQUIRE(response->get_status_code() == 206);
        REQUIRE(response->get_header("Content-Range") == "bytes 10-19/" + std::to_string(payload.size()));
        REQUIRE(response->read_all() == payload.substr(10, 10));
    }

    SECTION("HEAD returns headers without a body") {
        auto headers = client.head(fixture.base_url + "/file");
        REQUIRE(headers["content-length"] == std::to_string(payload.size()));
    }

    SECTION("Abandoned response does not block the next request") {
        {
            auto response = client.execute(http::method::GET, fixture.base_url + "/file");
            REQUIRE_FALSE(response->read(10).empty());
        }
        REQUIRE(client.get(fixture.base_url + "/file") == payload);
    }

    SECTION("Requests from several threads share one transport") {
        std::vector<std::thread> threads;
        std::atomic<int> matching{0};
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&client, &fixture, &payload, &matching, i]() {
                auto path = i % 2 == 0 ? "/file" : "/chunked";
                if (client.get(fixture.base_url + path) == payload) ++matching;
            });
        }
        for (auto& t : threads) t.join();
        REQUIRE(matching == 4);
    }

    SECTION("Response pulled while another request runs") {
        auto response = client.execute(http::method::GET, fixture.base_url + "/file");
        auto first = response->read(1000);
        std::string other;
        std::thread worker([&client, &fixture, &other]() {
            other = client.get(fixture.base_url + "/close");
        });
        std::string rest = response->read_all();
        worker.join();
        REQUIRE(first + rest == payload);
        REQUIRE(other == payload);
    }
}

TEST_CASE("Asio transport statuses and redirects", "[asio_transport][integration]") {
    test::RangeServerFixture fixture;
    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(5));
    http::client client(transport);

    SECTION("Error status is returned by execute") {
        auto response = client.execute(http::method::GET, fixture.base_url + "/status/503");
        REQUIRE(response->get_status_code() == 503);
        REQUIRE(response->read_all().empty());
    }

    SECTION("Error status raises http_error") {
        REQUIRE_THROWS_AS(client.get(fixture.base_url + "/status/404"), http_error);
    }

    SECTION("Redirects are followed") {
        REQUIRE(client.get(fixture.base_url + "/redirect/3") == fixture.payload());
    }

    SECTION("Redirect limit") {
        transport->max_redirects(2);
        REQUIRE_THROWS_AS(client.get(fixture.base_url + "/redirect/3"), transport_failure);
        REQUIRE_THROWS_AS(client.get(fixture.base_url + "/redirect-loop"), transport_failure);
    }

    SECTION("Redirects can be disabled") {
        transport->follow_redirects(false);
        auto response = client.execute(http::method::GET, fixture.base_url + "/redirect/1");
        REQUIRE(response->get_status_code() == 302);
        REQUIRE(response->get_header("Location") == "/file");
    }

    SECTION("303 switches a POST to GET") {
        auto body = client.post(fixture.base_url + "/see-other", {}, {{"a", 1}});
        auto reply = nlohmann::json::parse(body);
        REQUIRE(reply["method"] == "GET");
        REQUIRE(reply["body"] == "");
    }

    SECTION("POST sends JSON with browser headers") {
        auto body = client.post(fixture.base_url + "/echo", {}, {{"name", "test"}});
        auto reply = nlohmann::json::parse(body);
        REQUIRE(reply["method"] == "POST");
        REQUIRE(nlohmann::json::parse(reply["body"].get<std::string>()) == nlohmann::json{{"name", "test"}});
        REQUIRE(reply["content_type"] == "application/json");
        REQUIRE(reply["user_agent"].get<std::string>().rfind("Mozilla/5.0", 0) == 0);
    }
}

TEST_CASE("Asio transport failures", "[asio_transport][integration]") {
    auto transport = std::make_shared<http::asio_transport>();
    http::client client(transport);

    SECTION("Connection refused") {
        uint16_t port;
        {
            // grab a free port and release it
            test::RangeServerFixture fixture;
            port = fixture.port;
        }
        transport->timeout(std::chrono::seconds(2));
        REQUIRE_THROWS_AS(client.get("http://127.0.0.1:" + std::to_string(port) + "/file"), transport_failure);
    }

    SECTION("Timeout") {
        test::RangeServerFixture fixture;
        transport->timeout(std::chrono::seconds(1));
        try {
            client.get(fixture.base_url + "/slow");
            FAIL("expected transport_failure");
        } catch (const transport_failure& e) {
            REQUIRE(e.code() == boost::asio::error::timed_out);
        }
    }

    SECTION("Non http URL") {
        REQUIRE_THROWS_AS(transport->execute(http::http_request(http::method::GET, "ftp://127.0.0.1/file")),
                          invalid_url);
    }
}
