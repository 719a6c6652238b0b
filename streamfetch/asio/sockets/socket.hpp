#ifndef STREAMFETCH_ASIO_SOCKET_HPP
#define STREAMFETCH_ASIO_SOCKET_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

namespace streamfetch::asio {

/**
 * Blocking socket on top of Boost.Asio asynchronous operations. Every
 * operation runs the io_context until it completes or the timeout expires,
 * in which case the socket is closed and a transport_failure is raised.
 */
class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string &context, boost::asio::io_context &io_context);
    virtual ~socket();

    // socket control
    virtual void connect(const std::string &host,
                         const std::string &port,
                         std::chrono::seconds timeout) = 0;
    virtual void close() = 0;

    // read operations, returns 0 on end of stream
    virtual size_t read_some(uint8_t buffer[], size_t max_size, std::chrono::seconds timeout) = 0;

    // write operations
    virtual void write(std::string_view data, std::chrono::seconds timeout) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual bool is_secure() const = 0;

    // other methods
    static unsigned long get_connections();

protected:
    // run pending operations until they complete or the timeout expires
    void run_for(std::chrono::seconds timeout);

    std::string context_;
    boost::asio::io_context &io_context_;
    static std::atomic<unsigned long> connections;
};

}

#endif
