#include "size_resolver.hpp"
#include "endpoint.hpp"
#include "segment_header.hpp"
#include "../http/common/errors.hpp"
#include "../util/logger.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace streamfetch::stream {

size_resolver::size_resolver(http::client& client, size_cache& cache)
    : client_(client)
    , cache_(cache) {
}

std::uint64_t size_resolver::head_content_length(const std::string& url) {
    auto response = client_.execute(http::method::HEAD, url);
    http::client::check_status(*response, url);

    std::string value;
    try {
        value = response->require_header(http::header::content_length);
    } catch (const header_not_found&) {
        LOG_ERROR("HEAD {} returned no Content-Length", url);
        throw missing_content_length(url);
    }

    try {
        return boost::lexical_cast<std::uint64_t>(boost::algorithm::trim_copy(value));
    } catch (const boost::bad_lexical_cast&) {
        LOG_ERROR("HEAD {} returned an invalid Content-Length: '{}'", url, value);
        throw missing_content_length(url);
    }
}

std::uint64_t size_resolver::filesize(const std::string& url) {
    return cache_.get_or_compute(size_cache::kind::content_length, url, [this, &url]() {
        return head_content_length(url);
    });
}

std::uint64_t size_resolver::compute_seq_filesize(const std::string& url) {
    endpoint target(url);

    // segment 0 carries the header describing how the resource is segmented
    auto header_url = target.with_sequence(0).to_url();
    auto response = client_.execute(http::method::GET, header_url);
    http::client::check_status(*response, header_url);
    auto header_segment = response->read_all();
    response.reset();

    std::uint64_t total = header_segment.size();
    auto segment_count = parse_segment_count(header_segment);

    for (std::uint64_t sequence = 1; sequence <= segment_count; ++sequence) {
        total += head_content_length(target.with_sequence(sequence).to_url());
    }

    LOG_DEBUG("size of {} ({} segments): {} bytes", url, segment_count + 1, total);
    return total;
}

std::uint64_t size_resolver::seq_filesize(const std::string& url) {
    return cache_.get_or_compute(size_cache::kind::segmented, url, [this, &url]() {
        return compute_seq_filesize(url);
    });
}

}
