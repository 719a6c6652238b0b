#ifndef STREAMFETCH_HTTP_ERRORS_HPP
#define STREAMFETCH_HTTP_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

namespace streamfetch {

/**
 * Base class for every failure reported by the library.
 */
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * The URL is not an http(s) URL, or cannot be split into its components.
 * Always raised before any request is issued.
 */
class invalid_url : public error {
public:
    explicit invalid_url(const std::string& url)
        : error("Invalid URL: " + url), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

/**
 * A required response header is absent or malformed.
 */
class header_not_found : public error {
public:
    explicit header_not_found(const std::string& name)
        : error("Header not found: " + name), name_(name) {}

    header_not_found(const std::string& name, const std::string& message)
        : error(message), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * The content-length header of a HEAD response is absent or not a number.
 */
class missing_content_length : public header_not_found {
public:
    explicit missing_content_length(const std::string& url)
        : header_not_found("content-length", "Missing or invalid content-length for " + url) {}
};

/**
 * The body of segment 0 does not carry a "Segment-Count: <n>" line.
 */
class segment_header_not_found : public error {
public:
    segment_header_not_found()
        : error("Segment-Count marker not found in segment 0") {}
};

/**
 * Network or HTTP level failure reported by the transport.
 */
class transport_failure : public error {
public:
    explicit transport_failure(const std::string& message,
                               boost::system::error_code ec = {})
        : error(message), code_(ec) {}

    const boost::system::error_code& code() const { return code_; }

private:
    boost::system::error_code code_;
};

/**
 * The server answered with an error status (4xx or 5xx).
 */
class http_error : public transport_failure {
public:
    http_error(int status, const std::string& url)
        : transport_failure("HTTP error " + std::to_string(status) + " for " + url)
        , status_(status), url_(url) {}

    int status() const { return status_; }
    const std::string& url() const { return url_; }

private:
    int status_;
    std::string url_;
};

}

#endif
