#include "sequential_stream.hpp"
#include "segment_header.hpp"
#include "../util/logger.hpp"

#include <stdexcept>

namespace streamfetch::stream {

void segment_cursor::resolve(std::uint64_t segment_count) {
    if (segment_count_) {
        throw std::logic_error("segment count already resolved");
    }
    segment_count_ = segment_count;
}

bool segment_cursor::has_next() const {
    if (!segment_count_) {
        throw std::logic_error("segment count not resolved");
    }
    return sequence_number_ < *segment_count_;
}

void segment_cursor::advance() {
    if (!has_next()) {
        throw std::logic_error("no segment after " + std::to_string(sequence_number_));
    }
    ++sequence_number_;
}

sequential_stream::sequential_stream(http::client& client, const std::string& url, stream_options options)
    : client_(client)
    , endpoint_(url)
    , options_(options) {
}

void sequential_stream::start_segment() {
    auto url = endpoint_.with_sequence(cursor_.sequence_number()).to_url();
    LOG_DEBUG("starting segment {} of {}: {}", cursor_.sequence_number(),
              cursor_.segment_count() ? std::to_string(*cursor_.segment_count()) : "?", url);
    segment_ = std::make_unique<range_stream>(client_, std::move(url), options_);
    ++segments_started_;
}

std::optional<std::string> sequential_stream::next() {
    if (finished_) {
        return std::nullopt;
    }
    try {
        return pull();
    } catch (...) {
        // any failure ends the stream for good, no segment is resumed
        finished_ = true;
        segment_.reset();
        throw;
    }
}

std::optional<std::string> sequential_stream::pull() {
    while (!finished_) {
        if (!segment_) {
            if (!cursor_.segment_count()) {
                // segment 0 provides the header with the segment count
                start_segment();
            } else if (cursor_.has_next()) {
                cursor_.advance();
                start_segment();
            } else {
                finished_ = true;
                break;
            }
        }

        auto chunk = segment_->next();
        if (chunk) {
            if (!cursor_.segment_count()) {
                header_segment_.append(*chunk);
            }
            downloaded_ += chunk->size();
            return chunk;
        }

        segment_.reset();

        if (!cursor_.segment_count()) {
            std::string header;
            header.swap(header_segment_);
            cursor_.resolve(parse_segment_count(header));
            LOG_DEBUG("segmented resource has {} segments after the header", *cursor_.segment_count());
        }
    }

    return std::nullopt;
}

}
