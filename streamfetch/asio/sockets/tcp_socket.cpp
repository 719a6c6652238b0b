#include "tcp_socket.hpp"
#include "../../http/common/errors.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection");
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
}

void tcp_socket::connect(const std::string& host, const std::string& port, std::chrono::seconds timeout)
{
    close();

    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::system::error_code ec = boost::asio::error::would_block;

    resolver.async_resolve(host, port,
        [this, &ec](const boost::system::error_code& resolve_ec,
                    const boost::asio::ip::tcp::resolver::results_type& endpoints) {
            if (resolve_ec) {
                ec = resolve_ec;
                return;
            }
            boost::asio::async_connect(socket_, endpoints,
                [&ec](const boost::system::error_code& connect_ec, const boost::asio::ip::tcp::endpoint&) {
                    ec = connect_ec;
                });
        });

    run_for(timeout);

    if (ec) {
        LOG_ERROR("[{}] cannot connect to {}:{}: {}", context_, host, port, ec.message());
        close();
        throw transport_failure("Cannot connect to " + host + ":" + port + ": " + ec.message(), ec);
    }

    LOG_TRACE("[{}] connected to {}:{}", context_, host, port);
}

size_t tcp_socket::read_some(uint8_t buffer[], size_t max_size, std::chrono::seconds timeout) {
    boost::system::error_code ec;
    size_t bytes = 0;

    socket_.async_read_some(boost::asio::buffer(buffer, max_size),
        [&ec, &bytes](const boost::system::error_code& read_ec, size_t transferred) {
            ec = read_ec;
            bytes = transferred;
        });

    run_for(timeout);

    if (ec == boost::asio::error::eof) {
        return bytes;
    }
    if (ec) {
        throw transport_failure("Read error: " + ec.message(), ec);
    }
    return bytes;
}

void tcp_socket::write(std::string_view data, std::chrono::seconds timeout) {
    boost::system::error_code ec;

    boost::asio::async_write(socket_, boost::asio::buffer(data.data(), data.size()),
        [&ec](const boost::system::error_code& write_ec, size_t) {
            ec = write_ec;
        });

    run_for(timeout);

    if (ec) {
        throw transport_failure("Write error: " + ec.message(), ec);
    }
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

bool tcp_socket::is_secure() const {
    return false;
}

}
