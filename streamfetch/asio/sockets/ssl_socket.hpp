#ifndef STREAMFETCH_ASIO_SSL_SOCKET_HPP
#define STREAMFETCH_ASIO_SSL_SOCKET_HPP

#include "tcp_socket.hpp"
#include <memory>
#include <boost/asio/ssl.hpp>

namespace streamfetch::asio {

class ssl_socket : public tcp_socket {
public:
    // constructors and destructors
    ssl_socket(const std::string& context, boost::asio::io_context& io_context,
               const std::shared_ptr<boost::asio::ssl::context>& ssl_context,
               bool verify_peer = true);
    ~ssl_socket() override;

    // socket control, includes the client handshake
    void connect(const std::string& host,
                 const std::string& port,
                 std::chrono::seconds timeout) override;
    void close() override;

    // read operations
    size_t read_some(uint8_t buffer[], size_t max_size, std::chrono::seconds timeout) override;

    // write operations
    void write(std::string_view data, std::chrono::seconds timeout) override;

    // some getters to check the state
    bool is_secure() const override;

private:
    void handshake(const std::string& host, std::chrono::seconds timeout);

    boost::asio::ssl::stream<boost::asio::ip::tcp::socket&> ssl_stream_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
    bool verify_peer_;
};

}

#endif
