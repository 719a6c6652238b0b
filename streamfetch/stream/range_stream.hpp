#ifndef STREAMFETCH_STREAM_RANGE_STREAM_HPP
#define STREAMFETCH_STREAM_RANGE_STREAM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "stream_types.hpp"
#include "../http/client/client.hpp"

namespace streamfetch::stream {

/**
 * Streams a resource through successive ranged GET requests.
 *
 * The total size starts as a placeholder equal to the window size and is
 * replaced by the total announced in the Content-Range header of the first
 * response. If that header is missing or malformed the placeholder stays and
 * the stream ends on the first response that delivers no data. A server that
 * ignores the Range header and answers 200 has its whole body streamed as the
 * complete resource.
 *
 * Nothing is requested until the first call to next(). Destroying the stream
 * closes any response still being read.
 *
 * Usage:
 *   stream::range_stream stream(client, "https://cdn.example.com/video.mp4");
 *   while (auto chunk = stream.next()) {
 *       file.write(chunk->data(), chunk->size());
 *   }
 */
class range_stream : public chunk_source {
public:
    range_stream(http::client& client, std::string url, stream_options options = {});
    ~range_stream() override = default;

    range_stream(const range_stream&) = delete;
    range_stream& operator=(const range_stream&) = delete;

    std::optional<std::string> next() override;

    std::uint64_t downloaded() const override { return downloaded_; }

    // placeholder window size until the first response disclosed the real size
    std::uint64_t total_size() const { return total_size_; }
    bool size_known() const { return size_known_; }

    std::size_t requests_issued() const { return requests_; }
    const std::string& url() const { return url_; }

private:
    // issue the ranged request for the next window
    void open_window();

    http::client& client_;
    std::string url_;
    stream_options options_;

    std::uint64_t downloaded_ = 0;
    std::uint64_t total_size_ = 0;
    bool size_known_ = false;
    bool finished_ = false;
    bool whole_resource_ = false;

    std::size_t requests_ = 0;
    std::uint64_t window_received_ = 0;
    std::unique_ptr<http::http_response> response_;
};

}

#endif
