#ifndef STREAMFETCH_STREAM_TYPES_HPP
#define STREAMFETCH_STREAM_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace streamfetch::stream {

    // 4KB
    constexpr std::size_t default_chunk_size = 4096;

    // 9MB
    constexpr std::size_t default_window_size = 9437184;

    // query parameter carrying the segment sequence number
    constexpr std::string_view sequence_parameter = "sq";

    /**
     * Sizes used by the streamers.
     */
    struct stream_options {
        std::size_t chunk_size = default_chunk_size;    // bytes handed out per next()
        std::size_t window_size = default_window_size;  // bytes requested per ranged GET
    };

    /**
     * Pull interface for lazily produced byte chunks.
     *
     * Usage:
     *   while (auto chunk = source.next()) {
     *       out.write(chunk->data(), chunk->size());
     *   }
     */
    class chunk_source {
    public:
        virtual ~chunk_source() = default;

        /**
         * Produce the next non-empty chunk, or std::nullopt once the source is
         * exhausted. Network requests happen inside this call only.
         */
        virtual std::optional<std::string> next() = 0;

        /**
         * Bytes handed out so far.
         */
        virtual std::uint64_t downloaded() const = 0;
    };

}

#endif
