#ifndef STREAMFETCH_HTTP_UTIL_URL_HPP
#define STREAMFETCH_HTTP_UTIL_URL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamfetch::http::util::url{

    using query_parameters = std::vector<std::pair<std::string, std::string>>;

    // components of an absolute URL: scheme://host[:port]/path?query#fragment
    struct components {
        std::string scheme;     // lowercase
        std::string host;       // brackets removed for IPv6 literals
        std::string port;       // empty if not present in the URL
        std::string path;       // "/" if not present in the URL
        std::string query;      // without '?'
        std::string fragment;   // without '#'

        // port in the URL or the default for the scheme
        std::string effective_port() const;

        // path plus query, as sent in the request line
        std::string target() const;

        // scheme://host[:port]
        std::string origin() const;

        bool secure() const { return scheme == "https"; }
    };

    std::string url_encode(const std::string& value);

    bool url_decode(const std::string& in, std::string& out);
    std::string url_decode(const std::string& in);

    // split an absolute URL; std::nullopt if scheme or host are missing
    std::optional<components> split(std::string_view url);

    // true if the URL starts with http:// or https:// (case-insensitive)
    bool is_http_url(std::string_view url);

    // resolve a Location header value against the URL that produced it
    std::string resolve(const components& base, const std::string& location);

    // application/x-www-form-urlencoded parsing, order and duplicates preserved
    query_parameters parse_query(std::string_view query);
    std::string encode_query(const query_parameters& parameters);

}

#endif
