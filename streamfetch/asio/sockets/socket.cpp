#include "socket.hpp"
#include "../../http/common/errors.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::asio {

    std::atomic<unsigned long> socket::connections(0);

    socket::socket(const std::string& context, boost::asio::io_context& io_context)
        : context_(context), io_context_(io_context) {
        ++connections;
    }

    socket::~socket() {
        --connections;
    }

    unsigned long socket::get_connections() {
        return connections.load();
    }

    void socket::run_for(std::chrono::seconds timeout) {
        io_context_.restart();
        io_context_.run_for(timeout);

        // the io_context only stops by itself when the operation has completed
        if (!io_context_.stopped()) {
            LOG_ERROR("[{}] operation timed out after {} seconds", context_, timeout.count());
            close();
            // let the aborted handlers run before returning
            io_context_.run();
            throw transport_failure("Operation timed out", boost::asio::error::timed_out);
        }
    }

}
