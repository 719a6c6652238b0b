#include "client_connection.hpp"
#include "../common/errors.hpp"
#include "../../util/logger.hpp"

#include <algorithm>

namespace streamfetch::http {

namespace {

    // response whose body is pulled from the connection that received it
    class connection_response : public http_response {
    public:
        explicit connection_response(std::shared_ptr<client_connection> connection)
            : connection_(std::move(connection)) {}

        ~connection_response() override {
            close();
        }

        std::string read(std::size_t max_size) override {
            if (!connection_) return {};
            return connection_->read_body(max_size);
        }

        void close() override {
            if (connection_) {
                connection_->close();
                connection_.reset();
            }
        }

        // forget the connection without closing it
        void detach() {
            connection_.reset();
        }

    private:
        std::shared_ptr<client_connection> connection_;
    };

}

std::atomic<unsigned long> client_connection::connections(0);

client_connection::client_connection(std::shared_ptr<asio::socket> socket, std::chrono::seconds timeout,
                                     std::shared_ptr<boost::asio::io_context> io_context)
    : io_context_(std::move(io_context))
    , socket_(std::move(socket))
    , timeout_(timeout) {
    ++connections;
    LOG_TRACE("created http client connection with timeout: {} seconds. total: {}",
              timeout.count(), connections.load());
}

client_connection::~client_connection() {
    --connections;
    LOG_TRACE("releasing http client connection. total: {}", connections.load());
}

unsigned long client_connection::get_connections() {
    return connections.load();
}

std::unique_ptr<http_response> client_connection::send_request(const http_request& request) {
    if (!socket_->is_open()) {
        LOG_TRACE("connecting to: {}:{}", request.get_host(), request.get_port());
        socket_->connect(request.get_host(), request.get_port(), timeout_);
    }

    request.log("CLIENT->");
    socket_->write(request.to_string(), timeout_);

    while (true) {
        auto response = std::make_unique<connection_response>(shared_from_this());
        response_parser_.reset(*response);

        while (true) {
            if (pending_offset_ == pending_.size() && !fill()) {
                throw transport_failure("Connection closed before receiving a response",
                                        boost::asio::error::eof);
            }

            const char* begin = pending_.data() + pending_offset_;
            const char* end = pending_.data() + pending_.size();
            boost::tribool result = response_parser_.parse(begin, end);
            pending_offset_ = static_cast<size_t>(begin - pending_.data());

            if (result) {
                break;
            } else if (!result) {
                LOG_ERROR("malformed response head from {}", request.get_url());
                throw transport_failure("Malformed response from " + request.get_url(),
                                        boost::asio::error::invalid_argument);
            }
        }

        // interim responses (i.e., 100 Continue) precede the final one
        int status = response->get_status_code();
        if (status >= 100 && status < 200) {
            LOG_TRACE("skipping interim response {}", status);
            response->detach();
            continue;
        }

        response->log("<-CLIENT");
        configure_body(request, *response);
        return response;
    }
}

void client_connection::configure_body(const http_request& request, const http_response& response) {
    int status = response.get_status_code();
    body_done_ = false;
    remaining_ = 0;

    if (request.get_method() == method::HEAD || status == 204 || status == 304) {
        framing_ = body_framing::none;
        body_done_ = true;
    } else if (response.chunked()) {
        framing_ = body_framing::chunked;
        chunked_decoder_.reset();
    } else if (auto length = response.get_content_length()) {
        framing_ = body_framing::length_delimited;
        remaining_ = *length;
        body_done_ = remaining_ == 0;
    } else {
        framing_ = body_framing::until_close;
    }

    if (body_done_) {
        close();
    }
}

bool client_connection::fill() {
    if (!socket_->is_open()) {
        return false;
    }

    size_t bytes = socket_->read_some(buffer_, MAX_BUFFER_SIZE, timeout_);
    if (bytes == 0) {
        return false;
    }

    // drop consumed bytes before appending new input
    pending_.erase(0, pending_offset_);
    pending_offset_ = 0;
    pending_.append(reinterpret_cast<const char*>(buffer_), bytes);
    return true;
}

std::string client_connection::read_body(size_t max_size) {
    if (body_done_ || max_size == 0) {
        return {};
    }

    std::string out;

    switch (framing_) {
        case body_framing::length_delimited: {
            if (pending_offset_ == pending_.size() && !fill()) {
                throw transport_failure("Connection closed before the end of the body",
                                        boost::asio::error::eof);
            }
            size_t available = pending_.size() - pending_offset_;
            size_t bytes = static_cast<size_t>(std::min<std::uint64_t>(remaining_, std::min(available, max_size)));
            out.assign(pending_, pending_offset_, bytes);
            pending_offset_ += bytes;
            remaining_ -= bytes;
            body_done_ = remaining_ == 0;
            break;
        }
        case body_framing::until_close: {
            if (pending_offset_ == pending_.size() && !fill()) {
                body_done_ = true;
                break;
            }
            size_t bytes = std::min(pending_.size() - pending_offset_, max_size);
            out.assign(pending_, pending_offset_, bytes);
            pending_offset_ += bytes;
            break;
        }
        case body_framing::chunked: {
            while (out.empty()) {
                if (pending_offset_ == pending_.size() && !fill()) {
                    throw transport_failure("Connection closed before the last chunk",
                                            boost::asio::error::eof);
                }
                const char* begin = pending_.data() + pending_offset_;
                const char* end = pending_.data() + pending_.size();
                boost::tribool result = chunked_decoder_.decode(begin, end, out, max_size);
                pending_offset_ = static_cast<size_t>(begin - pending_.data());

                if (result) {
                    body_done_ = true;
                    break;
                } else if (!result) {
                    throw transport_failure("Malformed chunked body",
                                            boost::asio::error::invalid_argument);
                }
            }
            break;
        }
        case body_framing::none:
            body_done_ = true;
            break;
    }

    if (body_done_) {
        close();
    }

    return out;
}

void client_connection::close() {
    if (socket_->is_open()) {
        socket_->close();
    }
    pending_.clear();
    pending_offset_ = 0;
    body_done_ = true;
}

}
