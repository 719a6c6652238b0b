#include <catch2/catch_test_macros.hpp>
#include <streamfetch/stream/range_stream.hpp>
#include <streamfetch/http/common/errors.hpp>
#include "../../fixtures/mock_transport.hpp"

#include <vector>

using namespace streamfetch;
using namespace streamfetch::test;

namespace {

    std::vector<std::string> drain(stream::chunk_source& source) {
        std::vector<std::string> chunks;
        while (auto chunk = source.next()) {
            chunks.push_back(std::move(*chunk));
        }
        return chunks;
    }

    std::string join(const std::vector<std::string>& chunks) {
        std::string all;
        for (const auto& chunk : chunks) all += chunk;
        return all;
    }

    // response reporting its destruction through a shared flag
    class tracked_response : public scripted_response {
    public:
        tracked_response(std::unique_ptr<http::http_response> inner, std::shared_ptr<bool> released)
            : scripted_response(inner->get_status_code(), inner->read_all())
            , released_(std::move(released)) {
            for (const auto& [key, value] : inner->get_headers()) {
                process_header(key, value);
            }
        }

        ~tracked_response() override {
            *released_ = true;
        }

    private:
        std::shared_ptr<bool> released_;
    };

}

TEST_CASE("Range stream delivers the whole resource", "[range_stream][unit]") {
    const std::string payload = make_payload(10000);
    auto transport = std::make_shared<mock_transport>([&payload](const http::http_request& request) {
        return serve_range(request, payload);
    });
    http::client client(transport);

    SECTION("Chunks concatenate to the resource") {
        stream::range_stream stream(client, "http://media.example.com/file", {1000, 4096});
        auto chunks = drain(stream);

        REQUIRE(join(chunks) == payload);
        for (const auto& chunk : chunks) {
            REQUIRE_FALSE(chunk.empty());
            REQUIRE(chunk.size() <= 1000);
        }
        REQUIRE(stream.downloaded() == payload.size());
        REQUIRE(stream.total_size() == payload.size());
        REQUIRE(stream.size_known());
    }

    SECTION("Windows follow the disclosed size") {
        stream::range_stream stream(client, "http://media.example.com/file", {1000, 4096});
        drain(stream);

        auto requests = transport->requests();
        REQUIRE(requests.size() == 3);
        REQUIRE(requests[0].header("Range") == "bytes=0-4095");
        REQUIRE(requests[1].header("Range") == "bytes=4096-8191");
        REQUIRE(requests[2].header("Range") == "bytes=8192-9999");
        REQUIRE(stream.requests_issued() == 3);
        for (const auto& request : requests) {
            REQUIRE(request.method == http::method::GET);
            REQUIRE(request.url == "http://media.example.com/file");
        }
    }

    SECTION("Resource smaller than one window") {
        stream::range_stream stream(client, "http://media.example.com/file", {4096, 1 << 20});
        REQUIRE(join(drain(stream)) == payload);
        REQUIRE(transport->count() == 1);
    }

    SECTION("Exhausted stream keeps returning nothing") {
        stream::range_stream stream(client, "http://media.example.com/file", {4096, 4096});
        drain(stream);
        auto issued = transport->count();
        REQUIRE_FALSE(stream.next());
        REQUIRE_FALSE(stream.next());
        REQUIRE(transport->count() == issued);
    }
}

TEST_CASE("Range stream over a 20,000,000 byte resource", "[range_stream][unit]") {
    const std::uint64_t total = 20000000;
    auto transport = std::make_shared<mock_transport>([total](const http::http_request& request) {
        return serve_range(request, total, payload_byte);
    });
    http::client client(transport);

    stream::range_stream stream(client, "https://media.example.com/large", {1 << 20, 9437184});

    std::uint64_t received = 0;
    bool ordered = true;
    while (auto chunk = stream.next()) {
        if ((*chunk)[0] != payload_byte(received) || chunk->back() != payload_byte(received + chunk->size() - 1)) {
            ordered = false;
        }
        received += chunk->size();
    }

    REQUIRE(ordered);
    REQUIRE(received == total);

    auto requests = transport->requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(requests[0].header("Range") == "bytes=0-9437183");
    REQUIRE(requests[1].header("Range") == "bytes=9437184-18874367");
    REQUIRE(requests[2].header("Range") == "bytes=18874368-19999999");
}

TEST_CASE("Range stream is lazy", "[range_stream][unit]") {
    const std::string payload = make_payload(5000);
    auto transport = std::make_shared<mock_transport>([&payload](const http::http_request& request) {
        return serve_range(request, payload);
    });
    http::client client(transport);

    SECTION("No request before the first chunk is pulled") {
        stream::range_stream stream(client, "http://media.example.com/file", {1000, 2000});
        REQUIRE(transport->count() == 0);

        auto first = stream.next();
        REQUIRE(first);
        REQUIRE(*first == payload.substr(0, 1000));
        REQUIRE(transport->count() == 1);
        REQUIRE(stream.downloaded() == 1000);
    }

    SECTION("A window is only requested when the previous one is consumed") {
        stream::range_stream stream(client, "http://media.example.com/file", {1000, 2000});
        stream.next();
        stream.next();
        REQUIRE(transport->count() == 1);
        stream.next();
        REQUIRE(transport->count() == 2);
    }

    SECTION("Invalid URL fails on the first pull without a request") {
        stream::range_stream stream(client, "ftp://media.example.com/file");
        REQUIRE(transport->count() == 0);
        REQUIRE_THROWS_AS(stream.next(), invalid_url);
        REQUIRE(transport->count() == 0);
    }
}

TEST_CASE("Range stream abandonment releases the response", "[range_stream][unit]") {
    const std::string payload = make_payload(5000);
    auto released = std::make_shared<bool>(false);
    auto transport = std::make_shared<mock_transport>([&payload, released](const http::http_request& request)
            -> std::unique_ptr<http::http_response> {
        return std::make_unique<tracked_response>(serve_range(request, payload), released);
    });
    http::client client(transport);

    {
        stream::range_stream stream(client, "http://media.example.com/file", {100, 4096});
        REQUIRE(stream.next());
        REQUIRE_FALSE(*released);
    }

    REQUIRE(*released);
    REQUIRE(transport->count() == 1);
}

TEST_CASE("Range stream without a range-disclosure header", "[range_stream][unit]") {
    range_options hidden;
    hidden.disclose_size = false;

    SECTION("Resource shorter than the placeholder is read until no data is returned") {
        const std::string payload = make_payload(1000);
        auto transport = std::make_shared<mock_transport>([&payload, hidden](const http::http_request& request) {
            return serve_range(request, payload, hidden);
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {256, 4096});
        REQUIRE(join(drain(stream)) == payload);
        REQUIRE_FALSE(stream.size_known());
        REQUIRE(stream.downloaded() == 1000);
        REQUIRE(transport->count() == 2);
    }

    SECTION("Placeholder window is authoritative once filled") {
        const std::string payload = make_payload(10000);
        auto transport = std::make_shared<mock_transport>([&payload, hidden](const http::http_request& request) {
            return serve_range(request, payload, hidden);
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {1024, 4096});
        REQUIRE(join(drain(stream)) == payload.substr(0, 4096));
        REQUIRE(transport->count() == 1);
    }

    SECTION("Server ignoring Range delivers the whole resource in one response") {
        const std::string payload = make_payload(10000);
        auto transport = std::make_shared<mock_transport>([&payload](const http::http_request&) {
            auto response = std::make_unique<scripted_response>(200, payload, 700);
            response->process_header("Content-Length", std::to_string(payload.size()));
            return response;
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {1024, 4096});
        auto chunks = drain(stream);
        REQUIRE(join(chunks) == payload);
        for (const auto& chunk : chunks) {
            REQUIRE(chunk.size() <= 1024);
        }
        REQUIRE(stream.downloaded() == payload.size());
        REQUIRE(stream.total_size() == payload.size());
        REQUIRE(stream.size_known());
        REQUIRE(transport->count() == 1);
        REQUIRE(transport->requests()[0].header("Range") == "bytes=0-4095");
    }

    SECTION("Whole resource sent after a partial window is an error") {
        const std::string payload = make_payload(10000);
        auto transport = std::make_shared<mock_transport>([&payload](const http::http_request& request)
                -> std::unique_ptr<http::http_response> {
            if (request.get_header(http::header::range) == "bytes=0-4095") {
                return serve_range(request, payload);
            }
            return std::make_unique<scripted_response>(200, payload);
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {4096, 4096});
        REQUIRE(stream.next());
        REQUIRE_THROWS_AS(stream.next(), transport_failure);
    }

    SECTION("Empty response body ends the stream") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request&) {
            return std::make_unique<scripted_response>(200, std::string());
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file");
        REQUIRE_FALSE(stream.next());
        REQUIRE(transport->count() == 1);
    }
}

TEST_CASE("Range stream edge cases", "[range_stream][unit]") {

    SECTION("Empty resource") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request& request) {
            return serve_range(request, std::string());
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/empty");
        REQUIRE_FALSE(stream.next());
        REQUIRE(stream.downloaded() == 0);
        REQUIRE(stream.total_size() == 0);
        REQUIRE(stream.size_known());
    }

    SECTION("Short reads are reassembled") {
        const std::string payload = make_payload(3000);
        range_options trickle;
        trickle.max_read = 7;
        auto transport = std::make_shared<mock_transport>([&payload, trickle](const http::http_request& request) {
            return serve_range(request, payload, trickle);
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {512, 1024});
        auto chunks = drain(stream);
        REQUIRE(join(chunks) == payload);
        REQUIRE(transport->count() == 3);
    }

    SECTION("Bytes past the disclosed size are discarded") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request&) {
            auto response = std::make_unique<scripted_response>(206, std::string("0123456789EXTRA"));
            response->process_header("Content-Range", "bytes 0-9/10");
            return response;
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {64, 4096});
        REQUIRE(join(drain(stream)) == "0123456789");
        REQUIRE(stream.downloaded() == 10);
        REQUIRE(transport->count() == 1);
    }

    SECTION("Server stalling before the disclosed size is reached") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request& request) {
            const auto& range = request.get_header("Range");
            std::string body = range == "bytes=0-9" ? std::string("0123456789") : std::string();
            auto response = std::make_unique<scripted_response>(206, body);
            response->process_header("Content-Range", "bytes 0-9/100");
            return response;
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file", {64, 10});
        REQUIRE(stream.next() == std::string("0123456789"));
        REQUIRE_THROWS_AS(stream.next(), transport_failure);
    }

    SECTION("Error status raises http_error") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request&) {
            return std::make_unique<scripted_response>(403, std::string("forbidden"));
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file");
        try {
            stream.next();
            FAIL("expected http_error");
        } catch (const http_error& e) {
            REQUIRE(e.status() == 403);
        }
    }

    SECTION("Range not satisfiable before the disclosed end is an error") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request&) {
            auto response = std::make_unique<scripted_response>(416, std::string());
            response->process_header("Content-Range", "bytes */500");
            return response;
        });
        http::client client(transport);

        stream::range_stream stream(client, "http://media.example.com/file");
        REQUIRE_THROWS_AS(stream.next(), http_error);
    }

    SECTION("Zero sizes are rejected") {
        auto transport = std::make_shared<mock_transport>([](const http::http_request& request) {
            return serve_range(request, std::string("x"));
        });
        http::client client(transport);

        REQUIRE_THROWS_AS(stream::range_stream(client, "http://host/file", {0, 4096}), std::invalid_argument);
        REQUIRE_THROWS_AS(stream::range_stream(client, "http://host/file", {4096, 0}), std::invalid_argument);
    }
}
