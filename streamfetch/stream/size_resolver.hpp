#ifndef STREAMFETCH_STREAM_SIZE_RESOLVER_HPP
#define STREAMFETCH_STREAM_SIZE_RESOLVER_HPP

#include <cstdint>
#include <string>

#include "size_cache.hpp"
#include "../http/client/client.hpp"

namespace streamfetch::stream {

/**
 * Total size of remote resources, memoized per URL in the given cache.
 */
class size_resolver {
public:
    size_resolver(http::client& client, size_cache& cache);

    /**
     * Content-Length of a single HEAD request.
     * Throws missing_content_length if the header is absent or not a number.
     */
    std::uint64_t filesize(const std::string& url);

    /**
     * Size of a segmented resource: the length of segment 0 (fetched with a
     * plain GET) plus the Content-Length of a HEAD request for each of the
     * segments it announces. Throws segment_header_not_found if segment 0 has
     * no segment count.
     */
    std::uint64_t seq_filesize(const std::string& url);

private:
    std::uint64_t head_content_length(const std::string& url);
    std::uint64_t compute_seq_filesize(const std::string& url);

    http::client& client_;
    size_cache& cache_;
};

}

#endif
