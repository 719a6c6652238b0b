#ifndef STREAMFETCH_STREAM_SEGMENT_HEADER_HPP
#define STREAMFETCH_STREAM_SEGMENT_HEADER_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace streamfetch::stream {

    // marker announcing the number of segments in the body of segment 0
    constexpr std::string_view segment_count_marker = "Segment-Count: ";

    /**
     * Count announced by a single line, if the line carries the marker followed
     * by at least one decimal digit that fits in 64 bits.
     */
    std::optional<std::uint64_t> find_segment_count(std::string_view line);

    /**
     * Segment count from the raw bytes of segment 0. The body is split on CRLF
     * and the first line carrying a valid marker wins. Bytes outside that line
     * may be arbitrary binary data.
     *
     * Throws segment_header_not_found when no line matches.
     */
    std::uint64_t parse_segment_count(std::string_view segment_data);

}

#endif
