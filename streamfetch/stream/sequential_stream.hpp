#ifndef STREAMFETCH_STREAM_SEQUENTIAL_STREAM_HPP
#define STREAMFETCH_STREAM_SEQUENTIAL_STREAM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "endpoint.hpp"
#include "range_stream.hpp"

namespace streamfetch::stream {

/**
 * Position inside a segmented resource. The segment count is unknown until
 * segment 0 has been parsed and cannot change afterwards.
 */
class segment_cursor {
public:
    std::uint64_t sequence_number() const { return sequence_number_; }
    const std::optional<std::uint64_t>& segment_count() const { return segment_count_; }

    // throws std::logic_error if the count was already resolved
    void resolve(std::uint64_t segment_count);

    // true if there is a segment after the current one, requires a resolved count
    bool has_next() const;

    // move to the next segment, requires has_next()
    void advance();

private:
    std::uint64_t sequence_number_ = 0;
    std::optional<std::uint64_t> segment_count_;
};

/**
 * Streams a segmented resource: segment 0 carries a "Segment-Count: N" line,
 * then segments 1..N are fetched in order. Every segment goes through its own
 * range_stream, addressed with the sq query parameter.
 *
 * Only segment 0 is kept in memory, and only until its count has been read.
 *
 * Usage:
 *   stream::sequential_stream stream(client, "https://host/videoplayback?id=1");
 *   while (auto chunk = stream.next()) {
 *       file.write(chunk->data(), chunk->size());
 *   }
 */
class sequential_stream : public chunk_source {
public:
    // throws invalid_url if the URL is not an http(s) URL
    sequential_stream(http::client& client, const std::string& url, stream_options options = {});
    ~sequential_stream() override = default;

    sequential_stream(const sequential_stream&) = delete;
    sequential_stream& operator=(const sequential_stream&) = delete;

    std::optional<std::string> next() override;

    std::uint64_t downloaded() const override { return downloaded_; }

    std::uint64_t sequence_number() const { return cursor_.sequence_number(); }
    const std::optional<std::uint64_t>& segment_count() const { return cursor_.segment_count(); }

    // segment requests started so far, segment 0 included
    std::uint64_t segments_started() const { return segments_started_; }

private:
    void start_segment();

    // next chunk, across segment boundaries
    std::optional<std::string> pull();

    http::client& client_;
    endpoint endpoint_;
    stream_options options_;

    segment_cursor cursor_;
    std::unique_ptr<range_stream> segment_;
    std::string header_segment_;
    std::uint64_t segments_started_ = 0;
    std::uint64_t downloaded_ = 0;
    bool finished_ = false;
};

}

#endif
