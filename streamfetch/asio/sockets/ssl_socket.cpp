#include "ssl_socket.hpp"
#include "../../http/common/errors.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::asio {

ssl_socket::ssl_socket(const std::string& context, boost::asio::io_context& io_context,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context,
                       bool verify_peer)
    : tcp_socket(context, io_context)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context)
    , verify_peer_(verify_peer) {
}

ssl_socket::~ssl_socket() {
    LOG_TRACE("releasing ssl connection");
}

void ssl_socket::close() {
    // close underlying TCP socket
    tcp_socket::close();

    // clear ssl session to allow reusing socket (if necessary)
    // From SSL_clear: If a session is still open, it is considered bad and will be removed
    // from the session cache, as required by RFC2246
    SSL_clear(ssl_stream_.native_handle());
}

void ssl_socket::connect(const std::string& host, const std::string& port, std::chrono::seconds timeout) {
    tcp_socket::connect(host, port, timeout);
    handshake(host, timeout);
}

void ssl_socket::handshake(const std::string& host, std::chrono::seconds timeout) {
    // add support for SNI
    if (!SSL_set_tlsext_host_name(ssl_stream_.native_handle(), host.c_str())) {
        LOG_ERROR("SSL_set_tlsext_host_name failed. SNI will fail");
    }

    if (verify_peer_) {
        ssl_stream_.set_verify_mode(boost::asio::ssl::verify_peer);
        ssl_stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));
    } else {
        ssl_stream_.set_verify_mode(boost::asio::ssl::verify_none);
    }

    boost::system::error_code ec;
    ssl_stream_.async_handshake(boost::asio::ssl::stream_base::client,
        [&ec](const boost::system::error_code& handshake_ec) {
            ec = handshake_ec;
        });

    run_for(timeout);

    if (ec) {
        LOG_ERROR("[{}] ssl handshake with {} failed: {}", context_, host, ec.message());
        close();
        throw transport_failure("SSL handshake failed: " + ec.message(), ec);
    }
}

size_t ssl_socket::read_some(uint8_t buffer[], size_t max_size, std::chrono::seconds timeout) {
    boost::system::error_code ec;
    size_t bytes = 0;

    ssl_stream_.async_read_some(boost::asio::buffer(buffer, max_size),
        [&ec, &bytes](const boost::system::error_code& read_ec, size_t transferred) {
            ec = read_ec;
            bytes = transferred;
        });

    run_for(timeout);

    // many servers close the connection without sending close_notify
    if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
        return bytes;
    }
    if (ec) {
        throw transport_failure("Read error: " + ec.message(), ec);
    }
    return bytes;
}

void ssl_socket::write(std::string_view data, std::chrono::seconds timeout) {
    boost::system::error_code ec;

    boost::asio::async_write(ssl_stream_, boost::asio::buffer(data.data(), data.size()),
        [&ec](const boost::system::error_code& write_ec, size_t) {
            ec = write_ec;
        });

    run_for(timeout);

    if (ec) {
        throw transport_failure("Write error: " + ec.message(), ec);
    }
}

bool ssl_socket::is_secure() const {
    return true;
}

}
