#ifndef STREAMFETCH_HTTP_CLIENT_CONNECTION_HPP
#define STREAMFETCH_HTTP_CLIENT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "../../asio/sockets/socket.hpp"
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "response_parser.hpp"

namespace streamfetch::http {

/**
 * A single HTTP/1.1 exchange over a socket: connect, send the request, parse
 * the response head, then hand out the body on demand.
 */
class client_connection : public std::enable_shared_from_this<client_connection> {
public:
    static constexpr size_t MAX_BUFFER_SIZE = 16384;

    // io_context, when given, is the one driving the socket and lives as long as this connection
    client_connection(std::shared_ptr<asio::socket> socket, std::chrono::seconds timeout,
                      std::shared_ptr<boost::asio::io_context> io_context = nullptr);
    virtual ~client_connection();

    // send the request and read the response head; the body stays on the socket
    std::unique_ptr<http_response> send_request(const http_request& request);

    // read up to max_size bytes of the current response body, empty at the end
    std::string read_body(size_t max_size);

    void close();

    static unsigned long get_connections();

private:
    enum class body_framing {
        none,
        length_delimited,
        chunked,
        until_close
    };

    // read more raw bytes from the socket, returns false on end of stream
    bool fill();

    void configure_body(const http_request& request, const http_response& response);

    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<asio::socket> socket_;
    std::chrono::seconds timeout_;
    response_parser response_parser_;
    chunked_decoder chunked_decoder_;
    uint8_t buffer_[MAX_BUFFER_SIZE];
    std::string pending_;
    size_t pending_offset_ = 0;
    body_framing framing_ = body_framing::none;
    std::uint64_t remaining_ = 0;
    bool body_done_ = true;

    static std::atomic<unsigned long> connections;
};

}

#endif
