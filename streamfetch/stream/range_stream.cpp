#include "range_stream.hpp"
#include "range_window.hpp"
#include "../http/common/errors.hpp"
#include "../util/logger.hpp"

#include <stdexcept>

namespace streamfetch::stream {

range_stream::range_stream(http::client& client, std::string url, stream_options options)
    : client_(client)
    , url_(std::move(url))
    , options_(options)
    , total_size_(options.window_size) {
    if (options_.chunk_size == 0 || options_.window_size == 0) {
        throw std::invalid_argument("chunk and window sizes must be greater than zero");
    }
}

void range_stream::open_window() {
    auto window = next_window(downloaded_, total_size_, options_.window_size);
    bool first_request = requests_ == 0;

    LOG_DEBUG("requesting {} of {}", window.to_header(), url_);
    auto response = client_.execute(http::method::GET, url_,
                                    {{std::string(http::header::range), window.to_header()}});
    ++requests_;
    window_received_ = 0;

    if (response->get_status_code() == static_cast<int>(http::http_response::status::range_not_satisfiable)) {
        // nothing left at this offset, i.e., "bytes */0" for an empty resource
        auto total = find_range_total(*response);
        if ((total && *total == downloaded_) || (!total && !size_known_)) {
            LOG_DEBUG("range not satisfiable at offset {} of {}, stream completed", downloaded_, url_);
            total_size_ = downloaded_;
            size_known_ = size_known_ || total.has_value();
            finished_ = true;
            return;
        }
    }
    http::client::check_status(*response, url_);

    if (response->get_status_code() == static_cast<int>(http::http_response::status::ok)) {
        // the server ignored the Range header and sends the resource from its first byte
        if (downloaded_ > 0) {
            LOG_ERROR("range request for {} at offset {} answered with the whole resource", url_, downloaded_);
            throw transport_failure("Server ignored the Range request for " + url_);
        }
        LOG_DEBUG("range not supported by {}, reading the whole resource", url_);
        whole_resource_ = true;
        response_ = std::move(response);
        return;
    }

    if (first_request) {
        if (auto total = find_range_total(*response)) {
            total_size_ = *total;
            size_known_ = true;
            LOG_DEBUG("total size of {}: {} bytes", url_, total_size_);
        } else {
            LOG_WARNING("size of {} is unknown, continuing with a window of {} bytes", url_, total_size_);
        }
    }

    response_ = std::move(response);
}

std::optional<std::string> range_stream::next() {
    while (!finished_) {
        if (!response_) {
            if (downloaded_ >= total_size_) {
                finished_ = true;
                break;
            }
            open_window();
            continue;
        }

        // only a disclosed size bounds a response, the placeholder does not
        bool bounded = size_known_ && !whole_resource_;
        std::uint64_t remaining = bounded ? total_size_ - downloaded_ : 0;
        if (bounded && remaining == 0) {
            // the window is complete, ignore whatever the server sends beyond it
            response_.reset();
            continue;
        }

        auto chunk = response_->read(options_.chunk_size);
        if (chunk.empty()) {
            response_.reset();
            if (whole_resource_) {
                LOG_DEBUG("read the whole resource {}: {} bytes", url_, downloaded_);
                total_size_ = downloaded_;
                size_known_ = true;
                finished_ = true;
                break;
            }
            if (window_received_ == 0) {
                if (!size_known_) {
                    LOG_DEBUG("no more data for {} after {} bytes", url_, downloaded_);
                    total_size_ = downloaded_;
                    finished_ = true;
                    break;
                }
                LOG_ERROR("range request for {} at offset {} returned no data ({} of {} bytes)",
                          url_, downloaded_, downloaded_, total_size_);
                throw transport_failure("Range request returned no data for " + url_);
            }
            continue;
        }

        if (bounded && chunk.size() > remaining) {
            LOG_WARNING("discarding {} bytes past the end of {}", chunk.size() - remaining, url_);
            chunk.resize(static_cast<size_t>(remaining));
        }

        downloaded_ += chunk.size();
        window_received_ += chunk.size();
        return chunk;
    }

    return std::nullopt;
}

}
