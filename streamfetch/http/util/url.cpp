#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace streamfetch::http::util::url{

    namespace {
        constexpr char hex_chars[] = "0123456789ABCDEF";

        inline int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        inline bool is_unreserved(char c) {
            return std::isalnum(static_cast<unsigned char>(c))
                || c == '-' || c == '_' || c == '.' || c == '~';
        }

        inline bool is_scheme_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        }

        // decoded value, or the raw input if it is not valid percent-encoding
        std::string decode_or_keep(const std::string& in) {
            std::string out;
            if (url_decode(in, out)) {
                return out;
            }
            return in;
        }
    }

    std::string components::effective_port() const {
        if (!port.empty()) return port;
        return secure() ? "443" : "80";
    }

    std::string components::target() const {
        if (query.empty()) return path;
        return path + "?" + query;
    }

    std::string components::origin() const {
        std::string result = scheme + "://";
        if (host.find(':') != std::string::npos) {
            result += "[" + host + "]";
        } else {
            result += host;
        }
        if (!port.empty()) {
            result += ":" + port;
        }
        return result;
    }

    // RFC 3986 Section 2.3: unreserved characters are not percent-encoded
    std::string url_encode(const std::string &value) {
        std::string result;
        result.reserve(value.size() * 1.2);

        for (unsigned char c : value) {
            if (is_unreserved(c)) {
                result += static_cast<char>(c);
            } else {
                result += '%';
                result += hex_chars[c >> 4];
                result += hex_chars[c & 0x0F];
            }
        }

        return result;
    }

    bool url_decode(const std::string &in, std::string &out) {
        out.clear();
        out.reserve(in.size());

        for (size_t i = 0; i < in.size(); ++i) {
            if (in[i] == '%') {
                if (i + 2 >= in.size()) return false;
                int hi = hex_digit(in[i + 1]);
                int lo = hex_digit(in[i + 2]);
                if (hi < 0 || lo < 0) return false;
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else if (in[i] == '+') {
                out += ' ';
            } else {
                out += in[i];
            }
        }
        return true;
    }

    std::string url_decode(const std::string &in) {
        std::string out;
        if (url_decode(in, out)) {
            return out;
        }
        return {};
    }

    std::optional<components> split(std::string_view url) {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;
        auto scheme = url.substr(0, scheme_end);
        if (!std::all_of(scheme.begin(), scheme.end(), is_scheme_char)) return std::nullopt;

        components result;
        result.scheme = boost::algorithm::to_lower_copy(std::string(scheme));

        auto rest = url.substr(scheme_end + 3);
        auto authority_end = rest.find_first_of("/?#");
        auto authority = rest.substr(0, authority_end);
        rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

        // drop user information
        auto at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) return std::nullopt;
            result.host = std::string(authority.substr(1, close - 1));
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') return std::nullopt;
                result.port = std::string(after.substr(1));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                result.host = std::string(authority.substr(0, colon));
                result.port = std::string(authority.substr(colon + 1));
            } else {
                result.host = std::string(authority);
            }
        }

        if (result.host.empty()) return std::nullopt;
        if (!std::all_of(result.port.begin(), result.port.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return std::nullopt;
        }

        auto fragment_start = rest.find('#');
        if (fragment_start != std::string_view::npos) {
            result.fragment = std::string(rest.substr(fragment_start + 1));
            rest = rest.substr(0, fragment_start);
        }

        auto query_start = rest.find('?');
        if (query_start != std::string_view::npos) {
            result.query = std::string(rest.substr(query_start + 1));
            rest = rest.substr(0, query_start);
        }

        result.path = rest.empty() ? "/" : std::string(rest);
        return result;
    }

    bool is_http_url(std::string_view url) {
        return boost::algorithm::istarts_with(url, "http://") ||
               boost::algorithm::istarts_with(url, "https://");
    }

    std::string resolve(const components& base, const std::string& location) {
        if (location.find("://") != std::string::npos) {
            return location;
        }
        if (boost::algorithm::starts_with(location, "//")) {
            return base.scheme + ":" + location;
        }
        if (boost::algorithm::starts_with(location, "/")) {
            return base.origin() + location;
        }
        // relative to the directory of the current path
        auto directory = base.path.substr(0, base.path.rfind('/') + 1);
        return base.origin() + directory + location;
    }

    query_parameters parse_query(std::string_view query) {
        query_parameters store;

        auto it = query.begin();
        auto end = query.end();
        while (it != end) {
            // find the end of the current key=value pair
            auto pair_end = std::find(it, end, '&');

            // find the '=' separator within the pair
            auto eq_pos = std::find(it, pair_end, '=');

            std::string key(it, eq_pos);
            std::string value;
            if (eq_pos != pair_end) {
                value.assign(eq_pos + 1, pair_end);
            }

            if (!key.empty()) {
                store.emplace_back(decode_or_keep(key), decode_or_keep(value));
            }

            it = (pair_end != end) ? pair_end + 1 : end;
        }

        return store;
    }

    std::string encode_query(const query_parameters& parameters) {
        std::string result;
        bool first = true;
        for (const auto& [key, value] : parameters) {
            if (!first) result += '&';
            result += url_encode(key);
            result += '=';
            result += url_encode(value);
            first = false;
        }
        return result;
    }

}
