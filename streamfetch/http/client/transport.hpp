#ifndef STREAMFETCH_HTTP_CLIENT_TRANSPORT_HPP
#define STREAMFETCH_HTTP_CLIENT_TRANSPORT_HPP

#include <memory>
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"

namespace streamfetch::http {

/**
 * Performs a single HTTP request. The returned response exposes status and
 * headers; its body is read incrementally and must be read (or closed) before
 * the transport is destroyed.
 *
 * Implementations throw invalid_url for non http(s) URLs before any I/O and
 * transport_failure for network level errors.
 */
class transport {
public:
    virtual ~transport() = default;

    virtual std::unique_ptr<http_response> execute(const http_request& request) = 0;
};

} // namespace streamfetch::http

#endif // STREAMFETCH_HTTP_CLIENT_TRANSPORT_HPP
