#ifndef STREAMFETCH_ASIO_TCP_SOCKET_HPP
#define STREAMFETCH_ASIO_TCP_SOCKET_HPP

#include <utility>
#include <boost/asio.hpp>

#include "socket.hpp"

namespace streamfetch::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(const std::string &context, boost::asio::io_context &io_context);
    ~tcp_socket() override;

    // socket control
    void connect(const std::string &host,
                 const std::string &port,
                 std::chrono::seconds timeout) override;
    void close() override;

    // read operations
    size_t read_some(uint8_t buffer[], size_t max_size, std::chrono::seconds timeout) override;

    // write operations
    void write(std::string_view data, std::chrono::seconds timeout) override;

    // some getters to check the state
    bool is_open() const override;
    bool is_secure() const override;

protected:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
