#include "client.hpp"
#include "../common/errors.hpp"
#include "../util/url.hpp"
#include "../../util/logger.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace streamfetch::http {

client::client(std::shared_ptr<transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("client requires a transport");
    }
}

const std::vector<std::string>& client::browser_user_agents() {
    static const std::vector<std::string> agents{
        // Firefox
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 11.2; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (X11; Linux i686; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (Linux x86_64; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (X11; Fedora; Linux x86_64; rv:86.0) Gecko/20100101 Firefox/86.0",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 11_2_3 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) FxiOS/32.0 Mobile/15E148 Safari/605.1.15",
        "Mozilla/5.0 (Android 11; Mobile; rv:68.0) Gecko/68.0 Firefox/86.0",
        // Chrome
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/89.0.4389.82 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 11_2_3) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/89.0.4389.82 Safari/537.36",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/89.0.4389.82 Safari/537.36",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 14_4 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) CriOS/87.0.4280.77 Mobile/15E148 Safari/604.1",
        "Mozilla/5.0 (Linux; Android 10) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/89.0.4389.86 Mobile Safari/537.36",
    };
    return agents;
}

std::string client::pick_user_agent() {
    if (!user_agent_.empty()) {
        return user_agent_;
    }
    const auto& agents = browser_user_agents();
    std::uniform_int_distribution<size_t> pick(0, agents.size() - 1);
    std::lock_guard<std::mutex> lock(random_mutex_);
    return agents[pick(random_)];
}

std::unique_ptr<http_response> client::execute(method m, const std::string& url,
                                               const headers_map& headers, std::string body) {
    if (!util::url::is_http_url(url)) {
        LOG_ERROR("rejecting non http(s) URL: {}", url);
        throw invalid_url(url);
    }

    http_request request(m, url);
    request.set_header(std::string(header::user_agent), pick_user_agent());
    request.set_header(std::string(header::accept_language), accept_language_);
    for (const auto& [key, value] : headers) {
        request.set_header(key, value);
    }
    request.set_content(std::move(body));

    LOG_DEBUG("{} {}", get_method_string(m), url);
    return transport_->execute(request);
}

void client::check_status(const http_response& response, const std::string& url) {
    if (response.is_error()) {
        LOG_ERROR("HTTP error {} for {}", response.get_status_code(), url);
        throw http_error(response.get_status_code(), url);
    }
}

std::string client::get(const std::string& url, const headers_map& extra_headers) {
    auto response = execute(method::GET, url, extra_headers);
    check_status(*response, url);
    return response->read_all();
}

std::string client::post(const std::string& url, const headers_map& extra_headers, const nlohmann::json& data) {
    // servers are strict on the content type of JSON payloads
    headers_map headers;
    for (const auto& [key, value] : extra_headers) {
        if (!boost::iequals(key, header::content_type)) {
            headers.emplace(key, value);
        }
    }
    headers.emplace(std::string(header::content_type), "application/json");

    auto response = execute(method::POST, url, headers, data.dump());
    check_status(*response, url);
    return response->read_all();
}

headers_map client::head(const std::string& url) {
    auto response = execute(method::HEAD, url);
    check_status(*response, url);
    return response->lowercase_headers();
}

} // namespace streamfetch::http
