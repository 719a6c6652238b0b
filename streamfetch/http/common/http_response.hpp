#ifndef STREAMFETCH_HTTP_RESPONSE_HPP
#define STREAMFETCH_HTTP_RESPONSE_HPP

#include <cstddef>
#include <string>
#include "headers.hpp"

namespace streamfetch::http {

/**
 * Response returned by a transport. Status and headers are available as soon
 * as the response is returned; the body is pulled incrementally with read().
 */
class http_response : public headers {

public:

    enum class status {
        ok = 200,
        no_content = 204,
        partial_content = 206,
        moved_permanently = 301,
        found = 302,
        see_other = 303,
        not_modified = 304,
        temporary_redirect = 307,
        permanent_redirect = 308,
        bad_request = 400,
        not_found = 404,
        range_not_satisfiable = 416,
        internal_server_error = 500
    };

    http_response() = default;
    ~http_response() override = default;

    void set_status(int status_code);
    void set_reason_phrase(std::string reason);

    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    bool is_ok() const;
    bool is_error() const;
    bool is_redirect_response() const;

    /**
     * Read up to max_size bytes of the body. Returns an empty string once the
     * body is exhausted.
     */
    virtual std::string read(std::size_t max_size) = 0;

    /**
     * Read the remaining body until its end.
     */
    std::string read_all(std::size_t chunk_size = 8192);

    /**
     * Release the underlying connection. Further reads return no data.
     */
    virtual void close() {}

    void log(const char* scope) const override;

private:
    int status_ = static_cast<int>(status::ok);
    std::string reason_phrase_;
};

}

#endif
