#include "asio_transport.hpp"
#include "client_connection.hpp"
#include "../common/errors.hpp"
#include "../util/url.hpp"
#include "../../asio/sockets/tcp_socket.hpp"
#include "../../asio/sockets/ssl_socket.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::http {

std::shared_ptr<boost::asio::ssl::context> asio_transport::get_ssl_context() {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    if (!ssl_context_) {
        ssl_context_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::sslv23_client);
        ssl_context_->set_default_verify_paths();
        if (!verify_ssl_) {
            ssl_context_->set_verify_mode(boost::asio::ssl::verify_none);
        }
    }
    return ssl_context_;
}

void asio_transport::reset_ssl_context() {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    ssl_context_.reset();
}

std::shared_ptr<asio::socket> asio_transport::create_socket(const http_request& request,
                                                            boost::asio::io_context& io_context) {
    if (!request.is_secure()) {
        return std::make_shared<asio::tcp_socket>("http_client", io_context);
    }
    return std::make_shared<asio::ssl_socket>("http_client", io_context, get_ssl_context(), verify_ssl_);
}

void asio_transport::prepare(http_request& request) const {
    const auto& components = request.get_components();
    if (components.port.empty()) {
        request.set_header(std::string(header::host), components.host);
    } else {
        request.set_header(std::string(header::host), components.host + ":" + components.port);
    }
    request.set_header(std::string(header::connection), "close");

    const auto& content = request.get_content();
    if (!content.empty() || request.get_method() == method::POST ||
        request.get_method() == method::PUT || request.get_method() == method::PATCH) {
        request.set_header(std::string(header::content_length), std::to_string(content.size()));
    }
}

std::unique_ptr<http_response> asio_transport::send(http_request& request) {
    prepare(request);
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto connection = std::make_shared<client_connection>(create_socket(request, *io_context), timeout_, io_context);
    return connection->send_request(request);
}

std::unique_ptr<http_response> asio_transport::execute(const http_request& request) {
    if (!util::url::is_http_url(request.get_url())) {
        throw invalid_url(request.get_url());
    }

    http_request current = request;
    unsigned int redirect_count = 0;

    while (true) {
        auto response = send(current);

        if (!follow_redirects_ || !response->is_redirect_response()) {
            return response;
        }

        const auto& location = response->get_header(header::location);
        if (location.empty()) {
            LOG_WARNING("redirect {} from {} without Location header", response->get_status_code(), current.get_url());
            return response;
        }

        if (redirect_count >= max_redirects_) {
            LOG_ERROR("too many redirects ({}) for {}", redirect_count, request.get_url());
            throw transport_failure("Too many redirects for " + request.get_url());
        }
        ++redirect_count;

        auto target = util::url::resolve(current.get_components(), location);
        if (!util::url::is_http_url(target)) {
            throw invalid_url(target);
        }
        LOG_DEBUG("following redirect {} -> {}", current.get_url(), target);

        // 303 See Other (and 301/302 after POST, like browsers do) switch to GET
        int status = response->get_status_code();
        response->close();
        if (status == 303 || ((status == 301 || status == 302) && current.get_method() == method::POST)) {
            current.set_method(method::GET);
            current.set_content({});
            current.remove_header(header::content_length);
            current.remove_header(header::content_type);
        }
        current.set_url(target);
    }
}

} // namespace streamfetch::http
