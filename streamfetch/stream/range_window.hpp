#ifndef STREAMFETCH_STREAM_RANGE_WINDOW_HPP
#define STREAMFETCH_STREAM_RANGE_WINDOW_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../http/common/headers.hpp"

namespace streamfetch::stream {

    /**
     * Byte interval [start, stop], both ends inclusive.
     */
    struct range_window {
        std::uint64_t start = 0;
        std::uint64_t stop = 0;

        std::uint64_t size() const { return stop - start + 1; }

        // value for the Range request header: bytes=start-stop
        std::string to_header() const;

        bool operator==(const range_window& other) const {
            return start == other.start && stop == other.stop;
        }
    };

    /**
     * Window starting at downloaded, at most window_size bytes long and never
     * past total_size. Requires downloaded < total_size.
     */
    range_window next_window(std::uint64_t downloaded, std::uint64_t total_size, std::uint64_t window_size);

    /**
     * Total size from a range-disclosure value: "<unit> <start>-<end>/<total>".
     * Only <total> is used; an unknown total ("*") is not a size.
     */
    std::optional<std::uint64_t> parse_range_total(std::string_view content_range);

    /**
     * Total size from the Content-Range header of a response, std::nullopt if
     * the header is missing or malformed.
     */
    std::optional<std::uint64_t> find_range_total(const http::headers& headers);

}

#endif
