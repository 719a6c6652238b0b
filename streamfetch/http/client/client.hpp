#ifndef STREAMFETCH_HTTP_CLIENT_CLIENT_HPP
#define STREAMFETCH_HTTP_CLIENT_CLIENT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "transport.hpp"

namespace streamfetch::http {

using headers_map = std::map<std::string, std::string>;

/**
 * Request glue on top of a transport: URL validation, browser-like base
 * headers and error status mapping.
 *
 * Usage:
 *   http::client client(std::make_shared<http::asio_transport>());
 *
 *   // Simple GET, returns the body
 *   auto body = client.get("https://api.example.com/users");
 *
 *   // POST with JSON
 *   auto reply = client.post("https://api.example.com/users", {}, {{"name", "test"}});
 *
 *   // Response headers with lowercase keys
 *   auto headers = client.head("https://cdn.example.com/file.bin");
 */
class client {
public:
    explicit client(std::shared_ptr<transport> transport);

    // Configuration setters (fluent API), an empty user agent selects a random browser one per request
    client& user_agent(const std::string& agent) { user_agent_ = agent; return *this; }
    client& accept_language(const std::string& language) { accept_language_ = language; return *this; }

    // Configuration getters
    const std::string& get_user_agent() const { return user_agent_; }
    const std::string& get_accept_language() const { return accept_language_; }
    transport& get_transport() { return *transport_; }

    /**
     * Issue a request with the base headers merged under the given ones.
     * Throws invalid_url for non http(s) URLs before any I/O. The response
     * status is not checked.
     */
    std::unique_ptr<http_response> execute(method m, const std::string& url,
                                           const headers_map& headers = {}, std::string body = {});

    // GET the URL and return its body
    std::string get(const std::string& url, const headers_map& extra_headers = {});

    // POST a JSON document and return the response body
    std::string post(const std::string& url, const headers_map& extra_headers = {},
                     const nlohmann::json& data = nlohmann::json::object());

    // HEAD the URL and return its headers with lowercase keys
    headers_map head(const std::string& url);

    // throws http_error if the response carries an error status
    static void check_status(const http_response& response, const std::string& url);

    static const std::vector<std::string>& browser_user_agents();

private:
    std::string pick_user_agent();

    std::shared_ptr<transport> transport_;
    std::string user_agent_;
    std::string accept_language_{"en-US,en"};
    std::mutex random_mutex_;
    std::mt19937 random_{std::random_device{}()};
};

} // namespace streamfetch::http

#endif
