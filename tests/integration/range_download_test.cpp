#include <catch2/catch_test_macros.hpp>
#include <streamfetch/stream.hpp>
#include "../fixtures/range_server_fixture.hpp"

using namespace streamfetch;

namespace {

    std::string drain(stream::chunk_source& source, size_t max_chunk) {
        std::string all;
        while (auto chunk = source.next()) {
            REQUIRE_FALSE(chunk->empty());
            REQUIRE(chunk->size() <= max_chunk);
            all += *chunk;
        }
        return all;
    }

}

TEST_CASE("Range download over HTTP", "[range_stream][integration]") {
    test::RangeServerFixture fixture;
    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(5));
    http::client client(transport);

    SECTION("Windows smaller than the resource") {
        stream::range_stream stream(client, fixture.base_url + "/file", {4096, 30000});
        REQUIRE(drain(stream, 4096) == fixture.payload());
        REQUIRE(stream.size_known());
        REQUIRE(stream.total_size() == fixture.payload_size);
        REQUIRE(stream.requests_issued() == 4);
        REQUIRE(fixture.requests_served == 4);
    }

    SECTION("Default sizes") {
        stream::range_stream stream(client, fixture.base_url + "/file");
        REQUIRE(drain(stream, stream::default_chunk_size) == fixture.payload());
        REQUIRE(stream.requests_issued() == 1);
    }

    SECTION("Resource without a range-disclosure header") {
        stream::range_stream stream(client, fixture.base_url + "/file-hidden", {8192, 1 << 20});
        REQUIRE(drain(stream, 8192) == fixture.payload());
        REQUIRE_FALSE(stream.size_known());
        REQUIRE(stream.requests_issued() == 2);
    }

    SECTION("Server ignoring Range sends the whole resource at once") {
        stream::range_stream stream(client, fixture.base_url + "/chunked", {4096, 10000});
        REQUIRE(drain(stream, 4096) == fixture.payload());
        REQUIRE(stream.size_known());
        REQUIRE(stream.total_size() == fixture.payload_size);
        REQUIRE(stream.requests_issued() == 1);
    }

    SECTION("Empty resource") {
        fixture.payload_size = 0;
        stream::range_stream stream(client, fixture.base_url + "/file");
        REQUIRE_FALSE(stream.next());
        REQUIRE(stream.downloaded() == 0);
    }

    SECTION("Redirected resource") {
        stream::range_stream stream(client, fixture.base_url + "/redirect/2", {4096, 50000});
        REQUIRE(drain(stream, 4096) == fixture.payload());
    }

    SECTION("Missing resource") {
        stream::range_stream stream(client, fixture.base_url + "/missing");
        REQUIRE_THROWS_AS(stream.next(), http_error);
    }

    SECTION("Stream abandoned midway") {
        {
            stream::range_stream stream(client, fixture.base_url + "/file", {1024, 30000});
            REQUIRE(stream.next());
            REQUIRE(stream.next());
        }
        stream::range_stream stream(client, fixture.base_url + "/file");
        REQUIRE(drain(stream, stream::default_chunk_size) == fixture.payload());
    }
}

TEST_CASE("Segmented download over HTTP", "[sequential_stream][integration]") {
    test::RangeServerFixture fixture;
    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(5));
    http::client client(transport);

    SECTION("Every segment in order") {
        stream::sequential_stream stream(client, fixture.base_url + "/segmented?id=1", {512, 1024});
        REQUIRE(drain(stream, 512) == fixture.segmented.concatenated());
        REQUIRE(stream.segment_count() == 3u);
        REQUIRE(stream.segments_started() == 4);
    }

    SECTION("Size matches the streamed bytes") {
        stream::size_cache cache;
        stream::size_resolver resolver(client, cache);
        auto size = resolver.seq_filesize(fixture.base_url + "/segmented?id=1");
        REQUIRE(size == fixture.segmented.concatenated().size());

        stream::sequential_stream stream(client, fixture.base_url + "/segmented?id=1");
        REQUIRE(drain(stream, stream::default_chunk_size).size() == size);
    }
}

TEST_CASE("Resource size over HTTP", "[size_resolver][integration]") {
    test::RangeServerFixture fixture;
    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(5));
    http::client client(transport);
    stream::size_cache cache;
    stream::size_resolver resolver(client, cache);

    SECTION("HEAD Content-Length") {
        REQUIRE(resolver.filesize(fixture.base_url + "/file") == fixture.payload_size);
        REQUIRE(resolver.filesize(fixture.base_url + "/file") == fixture.payload_size);
        REQUIRE(fixture.requests_served == 1);
    }

    SECTION("Missing Content-Length") {
        REQUIRE_THROWS_AS(resolver.filesize(fixture.base_url + "/close"), missing_content_length);
    }
}
