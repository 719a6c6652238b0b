#ifndef STREAMFETCH_HTTP_CLIENT_ASIO_TRANSPORT_HPP
#define STREAMFETCH_HTTP_CLIENT_ASIO_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "transport.hpp"
#include "../../asio/sockets/socket.hpp"

namespace streamfetch::http {

/**
 * Blocking HTTP/1.1 transport over Boost.Asio (TCP or TLS).
 *
 * Each request uses its own connection (Connection: close) driven by its own
 * io_context, owned by the returned response, so requests may run from
 * several threads at once. Redirects are followed transparently.
 *
 * Usage:
 *   http::asio_transport transport;
 *   transport.timeout(std::chrono::seconds(10)).verify_ssl(false);
 *   auto response = transport.execute(http::http_request(http::method::GET, url));
 *   while (true) {
 *       auto chunk = response->read(4096);
 *       if (chunk.empty()) break;
 *   }
 */
class asio_transport : public transport {
private:
    std::mutex ssl_mutex_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;

    // Configuration
    std::chrono::seconds timeout_{30};
    unsigned int max_redirects_{5};
    bool follow_redirects_{true};
    bool verify_ssl_{true};

    std::shared_ptr<boost::asio::ssl::context> get_ssl_context();
    std::shared_ptr<asio::socket> create_socket(const http_request& request, boost::asio::io_context& io_context);
    std::unique_ptr<http_response> send(http_request& request);
    void prepare(http_request& request) const;
    void reset_ssl_context();

public:
    asio_transport() = default;
    ~asio_transport() override = default;

    // Configuration setters (fluent API)
    asio_transport& timeout(std::chrono::seconds t) { timeout_ = t; return *this; }
    asio_transport& max_redirects(unsigned int max) { max_redirects_ = max; return *this; }
    asio_transport& follow_redirects(bool follow) { follow_redirects_ = follow; return *this; }
    asio_transport& verify_ssl(bool verify) { verify_ssl_ = verify; reset_ssl_context(); return *this; }

    // Configuration getters
    std::chrono::seconds get_timeout() const { return timeout_; }
    unsigned int get_max_redirects() const { return max_redirects_; }
    bool get_follow_redirects() const { return follow_redirects_; }
    bool get_verify_ssl() const { return verify_ssl_; }

    std::unique_ptr<http_response> execute(const http_request& request) override;
};

} // namespace streamfetch::http

#endif
